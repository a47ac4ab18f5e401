#pragma once

#include <chronicle/schema/key/builder.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Schema key type: table keys.
// Every logical table is a key prefix: a keyspace tag followed by a fixed
// width hash of the table's name, so arbitrary entity and attribute names
// never produce overlapping prefixes. Rows append the 32-byte entity id and,
// for ledger and history rows, the big-endian vclock.
namespace chronicle::schema::key {

inline constexpr std::string_view kClockPrefix{"CHRONICLE|CLOCK|"};
inline constexpr std::string_view kHistoryPrefix{"CHRONICLE|HISTORY|"};
inline constexpr std::string_view kEntityPrefix{"CHRONICLE|ENTITY|"};

inline bytes_t make_clock_table(std::string_view entity_type) {
  return builder{}.write(kClockPrefix).hash(entity_type).data;
}

inline bytes_t make_history_table(std::string_view entity_type,
                                  std::string_view unit) {
  auto name = std::string{entity_type};
  name.push_back('|');
  name.append(unit);
  return builder{}.write(kHistoryPrefix).hash(name).data;
}

inline bytes_t make_entity_table(std::string_view entity_type) {
  return builder{}.write(kEntityPrefix).hash(entity_type).data;
}

/// Prefix of every row one entity owns in a ledger or history table.
inline bytes_t make_row_prefix(const bytes_t& table,
                               const entity_id_t& entity_id) {
  auto key = builder{.data = table};
  key.write(entity_id);
  return key.data;
}

inline bytes_t make_row_key(const bytes_t& table,
                            const entity_id_t& entity_id,
                            vclock_t vclock) {
  auto key = builder{.data = table};
  key.write(entity_id).write_ordered(vclock);
  return key.data;
}

inline bytes_t make_entity_key(const bytes_t& table,
                               const entity_id_t& entity_id) {
  return make_row_prefix(table, entity_id);
}

}  // namespace chronicle::schema::key
