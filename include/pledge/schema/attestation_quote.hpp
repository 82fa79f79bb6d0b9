#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct attestation_quote;

/// Enclave attestation evidence as produced by the software enclave. A
/// hardware runtime replaces this with its own opaque quote format.
template <>
struct attestation_quote<1> final {
  uint16_t version{1};
  hash32_t measurement{};
  hash32_t report_data{};
  hash32_t mac{};
};

using attestation_quote_t = attestation_quote<1>;

}  // namespace pledge::schema
