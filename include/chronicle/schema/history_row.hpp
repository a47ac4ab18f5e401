#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: history row.
// One recorded state of one tracked unit of one entity. values holds a
// single entry for a plain attribute and every member, in declaration order,
// for a composite group.
namespace chronicle::schema {

template <uint16_t Version>
struct history_row;

template <>
struct history_row<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  vclock_t vclock{};
  unit_values_t values;
  timestamp_milliseconds_t tick_start{};
  std::optional<timestamp_milliseconds_t> tick_end;
};

using history_row_t = history_row<1>;

}  // namespace chronicle::schema
