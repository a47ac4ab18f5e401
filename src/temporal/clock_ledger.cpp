#include <chronicle/errors/errors.hpp>
#include <chronicle/schema/key/table_keys.hpp>
#include <chronicle/temporal/clock_ledger.hpp>
#include <spdlog/spdlog.h>

using namespace chronicle::schema;
using namespace chronicle::storage;

namespace chronicle::temporal {

clock_ledger::clock_ledger(encoding::scale_encoder_t& encoder,
                           rocksdb_transaction_t& transaction)
    : encoder_{encoder}, transaction_{transaction} {}

std::optional<clock_record_t> clock_ledger::latest(
    const registered_type& type,
    const entity_id_t& entity_id) {
  auto rows = transaction_.execute(
      select_statement{.prefix = key::make_row_prefix(type.clock_table,
                                                      entity_id),
                       .reverse = true,
                       .limit = 1});
  if (rows.empty()) {
    return std::nullopt;
  }
  return encoder_.decode<clock_record_t>(make_bytes_view(rows.front().second));
}

std::vector<clock_record_t> clock_ledger::records(
    const registered_type& type,
    const entity_id_t& entity_id) {
  auto rows = transaction_.execute(select_statement{
      .prefix = key::make_row_prefix(type.clock_table, entity_id)});
  auto result = std::vector<clock_record_t>{};
  result.reserve(rows.size());
  for (const auto& [row_key, value] : rows) {
    result.push_back(encoder_.decode<clock_record_t>(make_bytes_view(value)));
  }
  return result;
}

vclock_t clock_ledger::advance(const registered_type& type,
                               const entity_id_t& entity_id,
                               timestamp_milliseconds_t at_time,
                               const std::optional<activity_id_t>& activity) {
  auto next = vclock_t{1};
  auto open = latest(type, entity_id);
  if (open) {
    if (open->tick_end) {
      spdlog::error("Clock ledger of {} entity {} has no open record",
                    type.policy.entity_type, to_hex(entity_id));
      throw chronicle::errors::storage_error{
          "clock ledger of " + type.policy.entity_type + " entity " +
          to_hex(entity_id) + " has no open record"};
    }
    if (at_time < open->tick_start) {
      spdlog::warn("Out of order clock advance for {}: {} < {}",
                   to_hex(entity_id), at_time, open->tick_start);
      throw chronicle::errors::out_of_order_error{entity_id, open->tick_start,
                                                  at_time};
    }
    if (activity) {
      for (const auto& record : records(type, entity_id)) {
        if (record.activity_id == activity) {
          spdlog::warn("Activity {} already stamps vclock {} of {}",
                       to_hex(*activity), record.vclock, to_hex(entity_id));
          throw chronicle::errors::duplicate_activity_error{entity_id,
                                                            *activity};
        }
      }
    }
    open->tick_end = at_time;
    transaction_.execute(update_statement{
        .key = key::make_row_key(type.clock_table, entity_id, open->vclock),
        .value = encoder_.encode(*open)});
    next = open->vclock + 1;
  }

  auto record = clock_record_t{};
  record.entity_id = entity_id;
  record.vclock = next;
  record.tick_start = at_time;
  record.activity_id = activity;
  transaction_.execute(insert_statement{
      .key = key::make_row_key(type.clock_table, entity_id, next),
      .value = encoder_.encode(record)});

  spdlog::debug("Advanced {} entity {} to vclock {} at {}",
                type.policy.entity_type, to_hex(entity_id), next, at_time);
  return next;
}

}  // namespace chronicle::temporal
