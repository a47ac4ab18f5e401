#pragma once
#include <chronicle/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

// Statements a transaction executes on behalf of the ledger and the history
// writer. Rows are opaque encoded values keyed by table prefix + row key.
namespace chronicle::storage {

using key_value_entry_t =
    std::pair<chronicle::schema::bytes_t, chronicle::schema::bytes_t>;
using rows_t = std::vector<key_value_entry_t>;

/// Add a row; fails if a row already exists at key.
struct insert_statement final {
  chronicle::schema::bytes_t key;
  chronicle::schema::bytes_t value;
};

/// Replace an existing row (closing its tick_end); fails if there is none.
struct update_statement final {
  chronicle::schema::bytes_t key;
  chronicle::schema::bytes_t value;
};

/// Unconditional write, used for the entity's current-state row.
struct upsert_statement final {
  chronicle::schema::bytes_t key;
  chronicle::schema::bytes_t value;
};

/// Rows under prefix in key order, including this transaction's writes.
/// reverse walks from the last key down; limit caps the number returned.
struct select_statement final {
  chronicle::schema::bytes_t prefix;
  bool reverse{false};
  std::optional<std::size_t> limit;
};

/// Zero or one row. With for_update the key joins the commit-time conflict
/// check even if this transaction never writes it.
struct get_statement final {
  chronicle::schema::bytes_t key;
  bool for_update{false};
};

using statement_t = std::variant<insert_statement,
                                 update_statement,
                                 upsert_statement,
                                 select_statement,
                                 get_statement>;

}  // namespace chronicle::storage
