#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: charge record.
// One entry per charge attempt that reached the ledger, appended in attempt
// order under the subscription's history prefix.
namespace pledge::schema {

template <uint16_t Version>
struct charge_record;

template <>
struct charge_record<1> final {
  uint16_t version{1};
  subscription_id_t subscription_id;
  uint32_t attempt{};
  timestamp_milliseconds_t attempted_at{};
  bool success{false};
  amount_t amount{};
  std::optional<hash32_t> transaction_hash;
  std::string message;
};

using charge_record_t = charge_record<1>;

}  // namespace pledge::schema
