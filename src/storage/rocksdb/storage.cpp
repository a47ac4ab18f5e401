#include <chronicle/common/critical.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <utility>

namespace chronicle::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    open_mode mode) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = mode == open_mode::create_if_missing;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::OptimisticTransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::OptimisticTransactionDB::Open(
      options, std::string{path}, &database);
  if (!status.ok()) {
    chronicle::common::critical("failed to open RocksDB at {}: {}", path,
                                status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const chronicle::schema::bytes_view_t& prefix) const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(detail::to_slice(prefix)); iterator->Valid();
       iterator->Next()) {
    if (!detail::starts_with(iterator->key(), prefix)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    chronicle::common::critical("RocksDB prefix scan failed: {}",
                                iterator->status().ToString());
  }
  return entries;
}

transaction<rocksdb_storage_tag> storage<rocksdb_storage_tag>::begin() const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
  }
  auto options = ROCKSDB_NAMESPACE::OptimisticTransactionOptions{};
  options.set_snapshot = true;
  auto handle = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
      database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{}, options)};
  return transaction<rocksdb_storage_tag>{std::move(handle)};
}

}  // namespace chronicle::storage
