#pragma once

#include <pledge/schema/error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace pledge::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string log;
  std::string codespace;

  bool ok() const { return code == error_code::ok; }
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_ok(std::string log = {}) {
  return operation_result_t{.code = error_code::ok, .log = std::move(log)};
}

inline operation_result_t make_error(const error_code code,
                                     std::string log,
                                     std::string codespace) {
  return operation_result_t{
      .code = code, .log = std::move(log), .codespace = std::move(codespace)};
}

/// Operation outcome carrying a value on success.
template <typename T>
struct value_result final {
  operation_result_t result;
  std::optional<T> value;

  bool ok() const { return result.ok() && value.has_value(); }
};

template <typename T>
value_result<T> make_value(T value) {
  return value_result<T>{.result = make_ok(), .value = std::move(value)};
}

template <typename T>
value_result<T> make_value_error(const error_code code,
                                 std::string log,
                                 std::string codespace) {
  return value_result<T>{
      .result = make_error(code, std::move(log), std::move(codespace)),
      .value = std::nullopt};
}

template <typename T>
value_result<T> forward_error(const operation_result_t& result) {
  return value_result<T>{.result = result, .value = std::nullopt};
}

}  // namespace pledge::schema
