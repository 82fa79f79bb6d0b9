#pragma once

#include <pledge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: subscription status.
// Lifecycle: pending until a scoped key is authorized, then active; paused and
// active alternate; cancelled and completed are terminal.
namespace pledge::schema {

enum class subscription_status_t : uint8_t {
  pending = 0,
  active = 1,
  paused = 2,
  cancelled = 3,
  completed = 4
};

inline constexpr auto kSubscriptionStatusMappings =
    std::array{std::pair<std::string_view, subscription_status_t>{
                   "pending", subscription_status_t::pending},
               std::pair<std::string_view, subscription_status_t>{
                   "active", subscription_status_t::active},
               std::pair<std::string_view, subscription_status_t>{
                   "paused", subscription_status_t::paused},
               std::pair<std::string_view, subscription_status_t>{
                   "cancelled", subscription_status_t::cancelled},
               std::pair<std::string_view, subscription_status_t>{
                   "completed", subscription_status_t::completed}};

template <>
inline std::optional<subscription_status_t>
try_from_string<subscription_status_t>(const std::string_view value) {
  return from_string(value, kSubscriptionStatusMappings);
}

inline constexpr std::string_view to_string(const subscription_status_t value) {
  return to_string(value, kSubscriptionStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const subscription_status_t value) {
  return value == subscription_status_t::cancelled ||
         value == subscription_status_t::completed;
}

}  // namespace pledge::schema
