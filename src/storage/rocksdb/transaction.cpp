#include <chronicle/errors/errors.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/storage/rocksdb/transaction.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace chronicle::storage {

namespace {

[[noreturn]] void throw_status(const ROCKSDB_NAMESPACE::Status& status,
                              const std::string_view what) {
  if (status.IsBusy() || status.IsTryAgain()) {
    spdlog::warn("Write conflict during {}: {}", what, status.ToString());
    throw chronicle::errors::concurrent_modification_error{
        std::string{what} + " conflicted with a concurrent transaction: " +
        status.ToString()};
  }
  spdlog::error("RocksDB {} failed: {}", what, status.ToString());
  throw chronicle::errors::storage_error{std::string{what} +
                                         " failed: " + status.ToString()};
}

}  // namespace

transaction<rocksdb_storage_tag>::transaction(
    std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle)
    : handle_{std::move(handle)} {}

transaction<rocksdb_storage_tag>::~transaction() {
  if (!handle_) {
    return;
  }
  auto status = handle_->Rollback();
  if (!status.ok()) {
    spdlog::error("Failed to roll back abandoned transaction: {}",
                  status.ToString());
  } else {
    spdlog::debug("Rolled back abandoned transaction");
  }
}

transaction<rocksdb_storage_tag>::transaction(transaction&& other) noexcept
    : handle_{std::move(other.handle_)},
      before_commit_{std::move(other.before_commit_)} {}

transaction<rocksdb_storage_tag>& transaction<rocksdb_storage_tag>::operator=(
    transaction&& other) noexcept {
  if (this != &other) {
    if (handle_) {
      auto status = handle_->Rollback();
      if (!status.ok()) {
        spdlog::error("Failed to roll back replaced transaction: {}",
                      status.ToString());
      }
    }
    handle_ = std::move(other.handle_);
    before_commit_ = std::move(other.before_commit_);
  }
  return *this;
}

void transaction<rocksdb_storage_tag>::require_open() const {
  if (!handle_) {
    throw chronicle::errors::storage_error{"transaction is no longer open"};
  }
}

rows_t transaction<rocksdb_storage_tag>::execute(const statement_t& statement) {
  require_open();
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = handle_->GetSnapshot();

  auto exists = [&](const chronicle::schema::bytes_t& key) {
    auto value = std::string{};
    auto status = handle_->Get(read_options, detail::to_slice(key), &value);
    if (status.IsNotFound()) {
      return false;
    }
    if (!status.ok()) {
      throw_status(status, "row lookup");
    }
    return true;
  };

  auto rows = rows_t{};
  std::visit(
      overloaded{
          [&](const insert_statement& insert) {
            if (exists(insert.key)) {
              throw chronicle::errors::storage_error{
                  "insert would overwrite an existing row"};
            }
            auto status = handle_->Put(detail::to_slice(insert.key),
                                       detail::to_slice(insert.value));
            if (!status.ok()) {
              throw_status(status, "insert");
            }
          },
          [&](const update_statement& update) {
            if (!exists(update.key)) {
              throw chronicle::errors::storage_error{
                  "update target row does not exist"};
            }
            auto status = handle_->Put(detail::to_slice(update.key),
                                       detail::to_slice(update.value));
            if (!status.ok()) {
              throw_status(status, "update");
            }
          },
          [&](const upsert_statement& upsert) {
            auto status = handle_->Put(detail::to_slice(upsert.key),
                                       detail::to_slice(upsert.value));
            if (!status.ok()) {
              throw_status(status, "upsert");
            }
          },
          [&](const select_statement& select) {
            auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
                handle_->GetIterator(read_options)};
            auto full = [&]() {
              return select.limit && rows.size() >= *select.limit;
            };
            if (select.reverse) {
              // Position on the last key under the prefix: the key before
              // the prefix's successor, or the last key of the keyspace.
              auto successor = detail::prefix_successor(select.prefix);
              if (successor) {
                iterator->Seek(detail::to_slice(*successor));
                if (iterator->Valid()) {
                  iterator->Prev();
                } else {
                  iterator->SeekToLast();
                }
              } else {
                iterator->SeekToLast();
              }
              for (; iterator->Valid() && !full(); iterator->Prev()) {
                if (!detail::starts_with(iterator->key(), select.prefix)) {
                  break;
                }
                rows.push_back(
                    key_value_entry_t{detail::to_bytes(iterator->key()),
                                      detail::to_bytes(iterator->value())});
              }
            } else {
              for (iterator->Seek(detail::to_slice(select.prefix));
                   iterator->Valid() && !full(); iterator->Next()) {
                if (!detail::starts_with(iterator->key(), select.prefix)) {
                  break;
                }
                rows.push_back(
                    key_value_entry_t{detail::to_bytes(iterator->key()),
                                      detail::to_bytes(iterator->value())});
              }
            }
            if (!iterator->status().ok()) {
              throw_status(iterator->status(), "select");
            }
          },
          [&](const get_statement& get) {
            auto value = std::string{};
            auto status =
                get.for_update
                    ? handle_->GetForUpdate(read_options,
                                            detail::to_slice(get.key), &value)
                    : handle_->Get(read_options, detail::to_slice(get.key),
                                   &value);
            if (status.IsNotFound()) {
              return;
            }
            if (!status.ok()) {
              throw_status(status, "get");
            }
            rows.push_back(key_value_entry_t{
                get.key, chronicle::schema::make_bytes(value)});
          }},
      statement);
  return rows;
}

void transaction<rocksdb_storage_tag>::on_before_commit(callback_t callback) {
  require_open();
  before_commit_.push_back(std::move(callback));
}

void transaction<rocksdb_storage_tag>::commit() {
  require_open();
  for (const auto& callback : before_commit_) {
    callback();
  }

  auto status = handle_->Commit();
  if (!status.ok()) {
    auto rollback_status = handle_->Rollback();
    if (!rollback_status.ok()) {
      spdlog::error("Failed to roll back after failed commit: {}",
                    rollback_status.ToString());
    }
    handle_.reset();
    before_commit_.clear();
    throw_status(status, "commit");
  }
  handle_.reset();
  before_commit_.clear();
}

void transaction<rocksdb_storage_tag>::rollback() {
  if (!handle_) {
    return;
  }
  auto status = handle_->Rollback();
  handle_.reset();
  before_commit_.clear();
  if (!status.ok()) {
    throw_status(status, "rollback");
  }
}

void transaction<rocksdb_storage_tag>::set_save_point() {
  require_open();
  handle_->SetSavePoint();
}

void transaction<rocksdb_storage_tag>::rollback_to_save_point() {
  require_open();
  auto status = handle_->RollbackToSavePoint();
  if (!status.ok()) {
    throw_status(status, "rollback to save point");
  }
}

void transaction<rocksdb_storage_tag>::pop_save_point() {
  require_open();
  auto status = handle_->PopSavePoint();
  if (!status.ok()) {
    throw_status(status, "pop save point");
  }
}

}  // namespace chronicle::storage
