#include <chronicle/query/reader.hpp>
#include <chronicle/schema/key/table_keys.hpp>

using namespace chronicle::schema;

namespace chronicle::query {

reader::reader(encoding::scale_encoder_t& encoder,
               const chronicle::storage::rocksdb_storage_t& storage,
               const registry& registry)
    : encoder_{encoder}, storage_{storage}, registry_{registry} {}

std::vector<clock_record_t> reader::clock_records(
    std::string_view entity_type,
    const entity_id_t& entity_id) const {
  const auto& type = registry_.at(entity_type);
  auto prefix = key::make_row_prefix(type.clock_table, entity_id);
  auto records = std::vector<clock_record_t>{};
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    records.push_back(encoder_.decode<clock_record_t>(make_bytes_view(value)));
  }
  return records;
}

std::vector<history_row_t> reader::history_rows(
    std::string_view entity_type,
    std::string_view unit,
    const entity_id_t& entity_id) const {
  auto prefix =
      key::make_row_prefix(registry_.table_for(entity_type, unit), entity_id);
  auto rows = std::vector<history_row_t>{};
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    rows.push_back(encoder_.decode<history_row_t>(make_bytes_view(value)));
  }
  return rows;
}

std::optional<history_row_t> reader::value_at_vclock(
    std::string_view entity_type,
    std::string_view unit,
    const entity_id_t& entity_id,
    vclock_t vclock) const {
  auto found = std::optional<history_row_t>{};
  for (auto& row : history_rows(entity_type, unit, entity_id)) {
    if (row.vclock > vclock) {
      break;
    }
    found = std::move(row);
  }
  return found;
}

std::optional<history_row_t> reader::value_as_of(
    std::string_view entity_type,
    std::string_view unit,
    const entity_id_t& entity_id,
    timestamp_milliseconds_t timestamp) const {
  for (auto& row : history_rows(entity_type, unit, entity_id)) {
    if (row.tick_start <= timestamp &&
        (!row.tick_end || timestamp < *row.tick_end)) {
      return std::move(row);
    }
  }
  return std::nullopt;
}

std::optional<timestamp_milliseconds_t> reader::date_created(
    std::string_view entity_type,
    const entity_id_t& entity_id) const {
  const auto& type = registry_.at(entity_type);
  auto record = storage_.get<clock_record_t>(
      encoder_,
      make_bytes_view(key::make_row_key(type.clock_table, entity_id, 1)));
  if (!record) {
    return std::nullopt;
  }
  return record->tick_start;
}

std::optional<timestamp_milliseconds_t> reader::date_modified(
    std::string_view entity_type,
    const entity_id_t& entity_id) const {
  auto records = clock_records(entity_type, entity_id);
  if (records.empty()) {
    return std::nullopt;
  }
  return records.back().tick_start;
}

std::optional<entity_record_t> reader::current(
    std::string_view entity_type,
    const entity_id_t& entity_id) const {
  const auto& type = registry_.at(entity_type);
  return storage_.get<entity_record_t>(
      encoder_,
      make_bytes_view(key::make_entity_key(type.entity_table, entity_id)));
}

}  // namespace chronicle::query
