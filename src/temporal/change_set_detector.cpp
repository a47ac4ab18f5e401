#include <chronicle/errors/errors.hpp>
#include <chronicle/temporal/change_set_detector.hpp>

using namespace chronicle::schema;

namespace chronicle::temporal {

namespace {

/// Member values of unit in values; std::nullopt when every member is unset.
std::optional<unit_values_t> resolve(const tracked_unit& unit,
                                     const attribute_values_t& values) {
  auto resolved = unit_values_t{};
  resolved.reserve(unit.members.size());
  const std::string* missing{nullptr};
  for (const auto& member : unit.members) {
    auto it = values.find(member);
    if (it == std::end(values)) {
      if (missing == nullptr) {
        missing = &member;
      }
      continue;
    }
    resolved.push_back(it->second);
  }
  if (resolved.empty()) {
    return std::nullopt;
  }
  if (missing != nullptr) {
    throw chronicle::errors::composite_integrity_error{unit.name, *missing};
  }
  return resolved;
}

}  // namespace

change_set_t diff(const registered_type& type,
                  const attribute_values_t& baseline,
                  const attribute_values_t& pending) {
  auto changes = change_set_t{};
  for (const auto& unit : type.units) {
    auto new_values = resolve(unit, pending);
    if (!new_values) {
      continue;
    }
    auto old_values = resolve(unit, baseline);
    if (old_values && *old_values == *new_values) {
      continue;
    }
    changes.push_back(unit_change{.unit = unit.name,
                                  .old_values = std::move(old_values),
                                  .new_values = std::move(*new_values)});
  }
  return changes;
}

change_set_t diff(const entity& target) {
  return diff(*target.type, target.baseline, target.values);
}

}  // namespace chronicle::temporal
