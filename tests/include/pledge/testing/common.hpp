#pragma once

#include <pledge/common/clock.hpp>
#include <pledge/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace pledge::testing {

inline constexpr auto kDayMilliseconds = uint64_t{86400000};

inline pledge::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = pledge::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Directory removed when the owner goes out of scope.
struct temp_directory final {
  explicit temp_directory(const std::string_view prefix)
      : path{make_db_path(prefix)} {
    std::filesystem::create_directories(path);
  }
  ~temp_directory() { remove_path(path); }
  temp_directory(const temp_directory&) = delete;
  temp_directory& operator=(const temp_directory&) = delete;

  std::string path;
};

/// Clock advanced by hand.
struct manual_clock final {
  explicit manual_clock(const pledge::schema::timestamp_milliseconds_t start =
                            1700000000000)
      : now{start} {}

  pledge::common::clock_t clock() {
    return [this] { return now.load(); };
  }

  void advance(const uint64_t milliseconds) { now += milliseconds; }

  std::atomic<pledge::schema::timestamp_milliseconds_t> now;
};

}  // namespace pledge::testing
