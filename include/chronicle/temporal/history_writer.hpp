#pragma once

#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/history_row.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/registry.hpp>
#include <chronicle/storage/rocksdb/transaction.hpp>
#include <chronicle/temporal/change_set.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::temporal {

/// Appends history rows, one table per tracked unit.
class history_writer final {
 public:
  history_writer(chronicle::schema::encoding::scale_encoder_t& encoder,
                 chronicle::storage::rocksdb_transaction_t& transaction);

  /// For each change, close the unit's open row at at_time and insert an
  /// open row carrying the new values at vclock. Replaying the same call in
  /// the same transaction leaves the rows as they are; recording different
  /// values at a vclock the unit already has throws storage_error.
  void record(const chronicle::schema::registered_type& type,
              const chronicle::schema::entity_id_t& entity_id,
              chronicle::schema::vclock_t vclock,
              chronicle::schema::timestamp_milliseconds_t at_time,
              const change_set_t& changes);

  std::optional<chronicle::schema::history_row_t> latest(
      const chronicle::schema::registered_type& type,
      std::string_view unit,
      const chronicle::schema::entity_id_t& entity_id);

  /// Rows of one unit of one entity, vclock ascending.
  std::vector<chronicle::schema::history_row_t> rows(
      const chronicle::schema::registered_type& type,
      std::string_view unit,
      const chronicle::schema::entity_id_t& entity_id);

 private:
  const chronicle::schema::bytes_t& table(
      const chronicle::schema::registered_type& type,
      std::string_view unit) const;

  chronicle::schema::encoding::scale_encoder_t& encoder_;
  chronicle::storage::rocksdb_transaction_t& transaction_;
};

}  // namespace chronicle::temporal
