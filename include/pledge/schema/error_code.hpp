#pragma once

#include <pledge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: error code.
// Stable numeric failure taxonomy shared by every component and surfaced
// unchanged through the RPC binding.
namespace pledge::schema {

enum class error_code : uint32_t {
  ok = 0,
  invalid_parameters = 1,
  not_found = 2,
  invalid_state = 3,
  already_stored = 4,
  already_exists = 5,
  ledger_rejected = 6,
  ledger_timeout = 7,
  enclave_unavailable = 8,
  registration_failed = 9,
  worker_not_verified = 10,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"invalid_parameters",
                                            error_code::invalid_parameters},
    std::pair<std::string_view, error_code>{"not_found", error_code::not_found},
    std::pair<std::string_view, error_code>{"invalid_state",
                                            error_code::invalid_state},
    std::pair<std::string_view, error_code>{"already_stored",
                                            error_code::already_stored},
    std::pair<std::string_view, error_code>{"already_exists",
                                            error_code::already_exists},
    std::pair<std::string_view, error_code>{"ledger_rejected",
                                            error_code::ledger_rejected},
    std::pair<std::string_view, error_code>{"ledger_timeout",
                                            error_code::ledger_timeout},
    std::pair<std::string_view, error_code>{"enclave_unavailable",
                                            error_code::enclave_unavailable},
    std::pair<std::string_view, error_code>{"registration_failed",
                                            error_code::registration_failed},
    std::pair<std::string_view, error_code>{"worker_not_verified",
                                            error_code::worker_not_verified}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace pledge::schema
