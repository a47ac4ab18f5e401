#pragma once

#include <chronicle/schema/clock_record.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/entity_record.hpp>
#include <chronicle/schema/history_row.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/registry.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::query {

/// Read paths over committed history. Nothing here writes.
///
/// Intervals are half-open: a row with tick_start s and tick_end e is the
/// effective value for s <= t < e, and for every t >= s while e is open.
class reader final {
 public:
  reader(chronicle::schema::encoding::scale_encoder_t& encoder,
         const chronicle::storage::rocksdb_storage_t& storage,
         const chronicle::schema::registry& registry);

  /// Clock records of an entity, vclock ascending.
  std::vector<chronicle::schema::clock_record_t> clock_records(
      std::string_view entity_type,
      const chronicle::schema::entity_id_t& entity_id) const;

  /// History rows of one tracked unit of an entity, vclock ascending.
  std::vector<chronicle::schema::history_row_t> history_rows(
      std::string_view entity_type,
      std::string_view unit,
      const chronicle::schema::entity_id_t& entity_id) const;

  /// Row that was current when the entity was at vclock.
  std::optional<chronicle::schema::history_row_t> value_at_vclock(
      std::string_view entity_type,
      std::string_view unit,
      const chronicle::schema::entity_id_t& entity_id,
      chronicle::schema::vclock_t vclock) const;

  /// Row that was effective at timestamp.
  std::optional<chronicle::schema::history_row_t> value_as_of(
      std::string_view entity_type,
      std::string_view unit,
      const chronicle::schema::entity_id_t& entity_id,
      chronicle::schema::timestamp_milliseconds_t timestamp) const;

  /// tick_start of vclock 1.
  std::optional<chronicle::schema::timestamp_milliseconds_t> date_created(
      std::string_view entity_type,
      const chronicle::schema::entity_id_t& entity_id) const;

  /// tick_start of the open clock record.
  std::optional<chronicle::schema::timestamp_milliseconds_t> date_modified(
      std::string_view entity_type,
      const chronicle::schema::entity_id_t& entity_id) const;

  /// Entity row as of the last commit.
  std::optional<chronicle::schema::entity_record_t> current(
      std::string_view entity_type,
      const chronicle::schema::entity_id_t& entity_id) const;

 private:
  chronicle::schema::encoding::scale_encoder_t& encoder_;
  const chronicle::storage::rocksdb_storage_t& storage_;
  const chronicle::schema::registry& registry_;
};

}  // namespace chronicle::query
