#include <pledge/common/critical.hpp>
#include <pledge/storage/rocksdb/storage.hpp>

namespace pledge::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    pledge::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::erase(
    const pledge::schema::bytes_view_t& key) const {
  if (!database) {
    pledge::common::critical("RocksDB database is not initialized");
  }
  auto existing = std::string{};
  auto lookup = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &existing);
  if (lookup.IsNotFound()) {
    return false;
  }
  if (!lookup.ok()) {
    spdlog::error("Failed to read key before delete: {}", lookup.ToString());
    pledge::common::critical("Failed to read key from RocksDB");
  }
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete key from RocksDB: {}", status.ToString());
    pledge::common::critical("Failed to delete key from RocksDB");
  }
  return true;
}

void storage<rocksdb_storage_tag>::apply(
    const std::vector<batch_operation>& operations) const {
  if (!database) {
    pledge::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& operation : operations) {
    auto key = detail::to_slice(operation.key);
    auto status = operation.value
                      ? batch.Put(key, detail::to_slice(*operation.value))
                      : batch.Delete(key);
    if (!status.ok()) {
      pledge::common::critical("failed staging key in write batch");
    }
  }
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    pledge::common::critical("failed to commit write batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const pledge::schema::bytes_view_t& prefix) const {
  if (!database) {
    pledge::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    pledge::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace pledge::storage
