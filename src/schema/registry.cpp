#include <chronicle/schema/key/table_keys.hpp>
#include <chronicle/schema/registry.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace chronicle::schema {

const registered_type& registry::add(temporal_policy policy) {
  validate(policy);
  if (types_.contains(policy.entity_type)) {
    throw std::invalid_argument{"entity type '" + policy.entity_type +
                                "' is already registered"};
  }

  auto type = std::make_unique<registered_type>();
  type->units = make_tracked_units(policy);
  type->clock_table = key::make_clock_table(policy.entity_type);
  type->entity_table = key::make_entity_table(policy.entity_type);
  for (const auto& unit : type->units) {
    type->history_tables.emplace(
        unit.name, key::make_history_table(policy.entity_type, unit.name));
    for (const auto& member : unit.members) {
      type->unit_of_attribute.emplace(member, unit.name);
    }
  }
  type->policy = std::move(policy);

  spdlog::debug("Registered temporal type '{}' with {} tracked unit(s)",
                type->policy.entity_type, type->units.size());
  auto name = type->policy.entity_type;
  auto [it, inserted] = types_.emplace(std::move(name), std::move(type));
  static_cast<void>(inserted);
  return *it->second;
}

const registered_type* registry::find(std::string_view entity_type) const {
  auto it = types_.find(entity_type);
  if (it == std::end(types_)) {
    return nullptr;
  }
  return it->second.get();
}

const registered_type& registry::at(std::string_view entity_type) const {
  auto type = find(entity_type);
  if (type == nullptr) {
    throw std::out_of_range{"entity type '" + std::string{entity_type} +
                            "' is not registered"};
  }
  return *type;
}

const temporal_policy& registry::policy(std::string_view entity_type) const {
  return at(entity_type).policy;
}

const bytes_t& registry::table_for(std::string_view entity_type,
                                   std::string_view unit) const {
  const auto& type = at(entity_type);
  auto it = type.history_tables.find(unit);
  if (it == std::end(type.history_tables)) {
    throw std::out_of_range{"entity type '" + std::string{entity_type} +
                            "' has no tracked unit '" + std::string{unit} +
                            "'"};
  }
  return it->second;
}

std::vector<std::string> registry::entity_types() const {
  auto names = std::vector<std::string>{};
  names.reserve(types_.size());
  for (const auto& [name, type] : types_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace chronicle::schema
