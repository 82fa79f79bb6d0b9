#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <pledge/common/critical.hpp>
#include <pledge/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace pledge::storage {

namespace detail {

inline pledge::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const pledge::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const pledge::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const pledge::schema::bytes_view_t& key,
           const T& value);

  bool erase(const pledge::schema::bytes_view_t& key) const;
  void apply(const std::vector<batch_operation>& operations) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const pledge::schema::bytes_view_t& prefix) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const pledge::schema::bytes_view_t& key) {
  if (!database) {
    pledge::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      pledge::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(pledge::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const pledge::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    pledge::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(pledge::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    pledge::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace pledge::storage
