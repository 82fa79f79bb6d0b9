#pragma once

#include <pledge/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace pledge::common {

/// Source of wall-clock time in milliseconds since the Unix epoch.
///
/// Components take a clock instead of reading the system clock directly so
/// that due-date arithmetic can be driven deterministically.
using clock_t = std::function<pledge::schema::timestamp_milliseconds_t()>;

inline pledge::schema::timestamp_milliseconds_t system_now() {
  return static_cast<pledge::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

inline clock_t system_clock() {
  return [] { return system_now(); };
}

}  // namespace pledge::common
