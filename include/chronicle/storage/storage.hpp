#pragma once
#include <chronicle/schema/primitives.hpp>
#include <chronicle/storage/statement.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::storage {

template <typename Library>
struct transaction;

/// Committed-state access to a backend. Everything the temporal core writes
/// goes through a transaction<Library> obtained from begin().
template <typename Library>
struct storage {
  /// Decode and return the committed value at key, or std::nullopt.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const chronicle::schema::bytes_view_t& key) const;

  /// Return all committed key-value pairs sharing the prefix, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const chronicle::schema::bytes_view_t& prefix) const;

  /// Open a transaction with snapshot isolation and commit-time conflict
  /// detection.
  transaction<Library> begin() const;
};

enum class open_mode {
  create_if_missing,
  /// Open only a database that already exists at path.
  existing_only,
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              open_mode mode = open_mode::create_if_missing);

}  // namespace chronicle::storage
