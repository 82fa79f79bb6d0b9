#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <string>

namespace pledge::schema {

template <uint16_t Version>
struct monitoring_status;

template <>
struct monitoring_status<1> final {
  uint16_t version{1};
  bool is_monitoring{false};
  uint64_t interval_ms{60000};
  std::optional<timestamp_milliseconds_t> last_run_at;
  std::optional<std::string> last_error;
};

using monitoring_status_t = monitoring_status<1>;

}  // namespace pledge::schema
