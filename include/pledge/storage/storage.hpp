#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace pledge::storage {

using key_value_entry_t =
    std::pair<pledge::schema::bytes_t, pledge::schema::bytes_t>;

/// One step of an atomic batch: a put when `value` is set, a delete otherwise.
struct batch_operation final {
  pledge::schema::bytes_t key;
  std::optional<pledge::schema::bytes_t> value;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const pledge::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const pledge::schema::bytes_view_t& key,
           const T& value);

  /// Remove key; returns false when the key was not present.
  bool erase(const pledge::schema::bytes_view_t& key) const;

  /// Apply puts and deletes as one atomic write.
  void apply(const std::vector<batch_operation>& operations) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const pledge::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace pledge::storage
