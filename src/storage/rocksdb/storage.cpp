#include <timeshare/common/critical.hpp>
#include <timeshare/storage/rocksdb/storage.hpp>

namespace timeshare::storage {

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
    timeshare::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::contains(
    const timeshare::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to probe key in RocksDB: {}", status.ToString());
    timeshare::common::critical("Failed to probe key in RocksDB");
  }
  return true;
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<key_value_entry_t>& entries) {
  require_open();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      timeshare::common::critical("failed staging key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    timeshare::common::critical("failed to commit write batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const timeshare::schema::bytes_view_t& prefix) const {
  require_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("Prefix scan failed: {}", iterator->status().ToString());
    timeshare::common::critical("Prefix scan failed");
  }
  return entries;
}

}  // namespace timeshare::storage
