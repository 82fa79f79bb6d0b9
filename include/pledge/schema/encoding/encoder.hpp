#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <span>

namespace pledge::schema::encoding {

// The codec is a build-time choice: callers name
// `encoder<scale_encoder_tag>` and the tag selects the specialization.
template <typename Library>
struct encoder {
  template <typename T>
  pledge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, pledge::schema::bytes_t& out);

  template <typename T>
  T decode(const pledge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const pledge::schema::bytes_view_t& bytes);
};

}  // namespace pledge::schema::encoding
