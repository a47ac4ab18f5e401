#pragma once

#include <chronicle/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::temporal {

/// One tracked unit whose value differs from the last flushed snapshot.
/// Composite units carry every member, changed or not, so the history row
/// written from this change is self-contained.
struct unit_change final {
  std::string unit;
  /// Empty when the unit had no recorded value (new entity, or a unit that
  /// was never assigned before).
  std::optional<chronicle::schema::unit_values_t> old_values;
  chronicle::schema::unit_values_t new_values;
};

/// Changes of one entity in tracked-unit declaration order.
using change_set_t = std::vector<unit_change>;

}  // namespace chronicle::temporal
