#pragma once

#include <pledge/schema/enum_string.hpp>
#include <pledge/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: worker status.
// The service's enclave-bound ledger identity: derived from the enclave
// measurement, registered with the contract, then verified on-chain.
namespace pledge::schema {

enum class worker_state_t : uint8_t {
  uninitialized = 0,
  derived = 1,
  registered_pending = 2,
  verified = 3
};

inline constexpr auto kWorkerStateMappings =
    std::array{std::pair<std::string_view, worker_state_t>{
                   "uninitialized", worker_state_t::uninitialized},
               std::pair<std::string_view, worker_state_t>{
                   "derived", worker_state_t::derived},
               std::pair<std::string_view, worker_state_t>{
                   "registered_pending", worker_state_t::registered_pending},
               std::pair<std::string_view, worker_state_t>{
                   "verified", worker_state_t::verified}};

template <>
inline std::optional<worker_state_t> try_from_string<worker_state_t>(
    const std::string_view value) {
  return from_string(value, kWorkerStateMappings);
}

inline constexpr std::string_view to_string(const worker_state_t value) {
  return to_string(value, kWorkerStateMappings).value_or("unknown");
}

template <uint16_t Version>
struct worker_status;

template <>
struct worker_status<1> final {
  uint16_t version{1};
  account_id_t account_id;
  worker_state_t state{worker_state_t::uninitialized};
  bool verified{false};
  bytes_t attestation_quote;
};

using worker_status_t = worker_status<1>;

}  // namespace pledge::schema
