#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>
#include <spdlog/spdlog.h>
#include <chronicle/common/critical.hpp>
#include <chronicle/storage/rocksdb/transaction.hpp>
#include <chronicle/storage/storage.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace chronicle::storage {

namespace detail {

inline chronicle::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const chronicle::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline bool starts_with(const ROCKSDB_NAMESPACE::Slice& key,
                        const chronicle::schema::bytes_view_t& prefix) {
  return key.starts_with(to_slice(prefix));
}

/// Smallest key greater than every key starting with prefix; std::nullopt
/// when the prefix is all 0xff bytes.
inline std::optional<chronicle::schema::bytes_t> prefix_successor(
    const chronicle::schema::bytes_view_t& prefix) {
  auto successor =
      chronicle::schema::bytes_t{std::begin(prefix), std::end(prefix)};
  while (!successor.empty()) {
    if (successor.back() != 0xff) {
      ++successor.back();
      return successor;
    }
    successor.pop_back();
  }
  return std::nullopt;
}

}  // namespace detail

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::OptimisticTransactionDB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const chronicle::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const chronicle::schema::bytes_view_t& prefix) const;

  transaction<rocksdb_storage_tag> begin() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    open_mode mode);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const chronicle::schema::bytes_view_t& key) const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    chronicle::common::critical("failed to get value from RocksDB: {}",
                                status.ToString());
  }
  return {encoder.template decode<T>(chronicle::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

}  // namespace chronicle::storage
