#pragma once

#include <chronicle/schema/clock_record.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/registry.hpp>
#include <chronicle/storage/rocksdb/transaction.hpp>
#include <optional>
#include <vector>

namespace chronicle::temporal {

/// Per-entity version ledger. Each entity has a gapless run of clock records
/// starting at vclock 1, of which only the newest is open.
class clock_ledger final {
 public:
  clock_ledger(chronicle::schema::encoding::scale_encoder_t& encoder,
               chronicle::storage::rocksdb_transaction_t& transaction);

  /// Close the open record at at_time and open vclock + 1 (or vclock 1 when
  /// the entity has no records yet). Returns the new vclock.
  ///
  /// Throws out_of_order_error when at_time precedes the open record's
  /// tick_start, and duplicate_activity_error when activity already stamps
  /// one of this entity's records.
  chronicle::schema::vclock_t advance(
      const chronicle::schema::registered_type& type,
      const chronicle::schema::entity_id_t& entity_id,
      chronicle::schema::timestamp_milliseconds_t at_time,
      const std::optional<chronicle::schema::activity_id_t>& activity);

  /// Newest record of the entity as seen by this transaction.
  std::optional<chronicle::schema::clock_record_t> latest(
      const chronicle::schema::registered_type& type,
      const chronicle::schema::entity_id_t& entity_id);

  /// Every record of the entity, vclock ascending.
  std::vector<chronicle::schema::clock_record_t> records(
      const chronicle::schema::registered_type& type,
      const chronicle::schema::entity_id_t& entity_id);

 private:
  chronicle::schema::encoding::scale_encoder_t& encoder_;
  chronicle::storage::rocksdb_transaction_t& transaction_;
};

}  // namespace chronicle::temporal
