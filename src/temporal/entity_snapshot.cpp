#include <chronicle/schema/key/table_keys.hpp>
#include <chronicle/temporal/entity_snapshot.hpp>

using namespace chronicle::schema;
using namespace chronicle::storage;

namespace chronicle::temporal {

entity_snapshot::entity_snapshot(encoding::scale_encoder_t& encoder,
                                 rocksdb_transaction_t& transaction)
    : encoder_{encoder}, transaction_{transaction} {}

std::optional<entity_record_t> entity_snapshot::get(
    const registered_type& type,
    const entity_id_t& entity_id,
    bool for_update) {
  auto rows = transaction_.execute(
      get_statement{.key = key::make_entity_key(type.entity_table, entity_id),
                    .for_update = for_update});
  if (rows.empty()) {
    return std::nullopt;
  }
  return encoder_.decode<entity_record_t>(make_bytes_view(rows.front().second));
}

void entity_snapshot::put(const registered_type& type,
                          const entity_id_t& entity_id,
                          vclock_t vclock,
                          const attribute_values_t& values) {
  auto record = entity_record_t{};
  record.entity_id = entity_id;
  record.vclock = vclock;
  record.values.reserve(values.size());
  for (const auto& [name, value] : values) {
    record.values.push_back(attribute_value{.name = name, .value = value});
  }
  transaction_.execute(upsert_statement{
      .key = key::make_entity_key(type.entity_table, entity_id),
      .value = encoder_.encode(record)});
}

attribute_values_t to_attribute_values(const entity_record_t& record) {
  auto values = attribute_values_t{};
  for (const auto& entry : record.values) {
    values.insert_or_assign(entry.name, entry.value);
  }
  return values;
}

}  // namespace chronicle::temporal
