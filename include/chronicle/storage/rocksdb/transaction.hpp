#pragma once
#include <rocksdb/utilities/optimistic_transaction_db.h>
#include <rocksdb/utilities/transaction.h>
#include <chronicle/storage/statement.hpp>
#include <chronicle/storage/storage.hpp>
#include <functional>
#include <memory>
#include <vector>

namespace chronicle::storage {

struct rocksdb_storage_tag {};

/// One optimistic RocksDB transaction. Writes are buffered until commit();
/// reads see this transaction's own writes. Keys written or read with
/// for_update are validated at commit, and a conflicting commit by another
/// transaction surfaces as concurrent_modification_error.
///
/// Destroying an open transaction rolls it back.
template <>
struct transaction<rocksdb_storage_tag> final {
  using callback_t = std::function<void()>;

  explicit transaction(
      std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle);
  ~transaction();

  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;
  transaction(transaction&& other) noexcept;
  transaction& operator=(transaction&& other) noexcept;

  /// Execute one statement. Only select and get return rows.
  rows_t execute(const statement_t& statement);

  /// Register a callback run, in registration order, at the start of
  /// commit(). A throwing callback aborts the commit; the transaction stays
  /// open so the caller can roll back.
  void on_before_commit(callback_t callback);

  void commit();
  void rollback();
  bool is_open() const noexcept { return static_cast<bool>(handle_); }

  void set_save_point();
  void rollback_to_save_point();
  void pop_save_point();

 private:
  void require_open() const;

  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle_;
  std::vector<callback_t> before_commit_;
};

using rocksdb_transaction_t = transaction<rocksdb_storage_tag>;

}  // namespace chronicle::storage
