#include <chronicle/errors/errors.hpp>
#include <chronicle/schema/key/table_keys.hpp>
#include <chronicle/temporal/history_writer.hpp>
#include <spdlog/spdlog.h>

#include <string>

using namespace chronicle::schema;
using namespace chronicle::storage;

namespace chronicle::temporal {

history_writer::history_writer(encoding::scale_encoder_t& encoder,
                               rocksdb_transaction_t& transaction)
    : encoder_{encoder}, transaction_{transaction} {}

const bytes_t& history_writer::table(const registered_type& type,
                                     std::string_view unit) const {
  auto it = type.history_tables.find(unit);
  if (it == std::end(type.history_tables)) {
    throw chronicle::errors::unknown_attribute_error{type.policy.entity_type,
                                                     unit};
  }
  return it->second;
}

std::optional<history_row_t> history_writer::latest(
    const registered_type& type,
    std::string_view unit,
    const entity_id_t& entity_id) {
  auto rows = transaction_.execute(select_statement{
      .prefix = key::make_row_prefix(table(type, unit), entity_id),
      .reverse = true,
      .limit = 1});
  if (rows.empty()) {
    return std::nullopt;
  }
  return encoder_.decode<history_row_t>(make_bytes_view(rows.front().second));
}

std::vector<history_row_t> history_writer::rows(const registered_type& type,
                                                std::string_view unit,
                                                const entity_id_t& entity_id) {
  auto entries = transaction_.execute(select_statement{
      .prefix = key::make_row_prefix(table(type, unit), entity_id)});
  auto result = std::vector<history_row_t>{};
  result.reserve(entries.size());
  for (const auto& [row_key, value] : entries) {
    result.push_back(encoder_.decode<history_row_t>(make_bytes_view(value)));
  }
  return result;
}

void history_writer::record(const registered_type& type,
                            const entity_id_t& entity_id,
                            vclock_t vclock,
                            timestamp_milliseconds_t at_time,
                            const change_set_t& changes) {
  for (const auto& change : changes) {
    const auto& unit_table = table(type, change.unit);
    auto last = latest(type, change.unit, entity_id);
    if (last) {
      if (last->vclock == vclock) {
        if (last->values == change.new_values) {
          spdlog::debug("History of {}.{} already recorded at vclock {}",
                        type.policy.entity_type, change.unit, vclock);
          continue;
        }
        spdlog::error("History of {}.{} already holds different values at "
                      "vclock {}",
                      type.policy.entity_type, change.unit, vclock);
        throw chronicle::errors::storage_error{
            "history of " + type.policy.entity_type + "." + change.unit +
            " already holds different values at vclock " +
            std::to_string(vclock)};
      }
      if (last->vclock > vclock) {
        throw chronicle::errors::storage_error{
            "history of " + type.policy.entity_type + "." + change.unit +
            " is ahead of vclock " + std::to_string(vclock)};
      }
      if (at_time < last->tick_start) {
        throw chronicle::errors::out_of_order_error{entity_id,
                                                    last->tick_start, at_time};
      }
      if (!last->tick_end) {
        last->tick_end = at_time;
        transaction_.execute(update_statement{
            .key = key::make_row_key(unit_table, entity_id, last->vclock),
            .value = encoder_.encode(*last)});
      }
    }

    auto row = history_row_t{};
    row.entity_id = entity_id;
    row.vclock = vclock;
    row.values = change.new_values;
    row.tick_start = at_time;
    transaction_.execute(insert_statement{
        .key = key::make_row_key(unit_table, entity_id, vclock),
        .value = encoder_.encode(row)});
    spdlog::debug("Recorded {}.{} of {} at vclock {}: {}",
                  type.policy.entity_type, change.unit, to_hex(entity_id),
                  vclock, describe(change.new_values));
  }
}

}  // namespace chronicle::temporal
