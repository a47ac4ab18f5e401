#pragma once

#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/storage/rocksdb/transaction.hpp>
#include <chronicle/temporal/clock_ledger.hpp>
#include <chronicle/temporal/entity.hpp>
#include <chronicle/temporal/entity_snapshot.hpp>
#include <chronicle/temporal/history_writer.hpp>
#include <chronicle/temporal/scope_controller.hpp>
#include <cstddef>
#include <vector>

namespace chronicle::temporal {

struct recorded_version final {
  entity_key key;
  chronicle::schema::vclock_t vclock{};
  std::size_t changed_units{};
};

/// Outcome of one flush.
struct flush_report final {
  chronicle::schema::timestamp_milliseconds_t at_time{};
  /// Entities whose vclock advanced, in processing order.
  std::vector<recorded_version> recorded;
  /// Dirty entities left pending: still inside an open scope, or persisted
  /// only at commit.
  std::vector<entity_key> deferred;
};

/// Turns pending in-memory changes into history rows and clock ticks inside
/// the caller's transaction. Entities are processed in identity order; any
/// failure undoes every write of the flush and leaves the entities as they
/// were.
class flush_coordinator final {
 public:
  flush_coordinator(chronicle::schema::encoding::scale_encoder_t& encoder,
                    chronicle::storage::rocksdb_transaction_t& transaction,
                    const scope_controller& scopes,
                    bool strict = false);

  /// committing is true for the flush run by commit(). Only that flush
  /// records persist_on_commit entities and entities of a scope that is
  /// still open.
  flush_report flush(const std::vector<entity*>& entities,
                     chronicle::schema::timestamp_milliseconds_t at_time,
                     bool committing);

 private:
  chronicle::storage::rocksdb_transaction_t& transaction_;
  const scope_controller& scopes_;
  bool strict_{false};
  clock_ledger ledger_;
  history_writer writer_;
  entity_snapshot snapshot_;
};

}  // namespace chronicle::temporal
