#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: clock record.
// One version of one entity: the vclock and the half-open interval
// [tick_start, tick_end) during which it was current. tick_end is empty
// while the version is still current.
namespace chronicle::schema {

template <uint16_t Version>
struct clock_record;

template <>
struct clock_record<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  vclock_t vclock{};
  timestamp_milliseconds_t tick_start{};
  std::optional<timestamp_milliseconds_t> tick_end;
  std::optional<activity_id_t> activity_id;
};

using clock_record_t = clock_record<1>;

}  // namespace chronicle::schema
