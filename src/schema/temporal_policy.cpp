#include <chronicle/schema/temporal_policy.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace chronicle::schema {

namespace {

bool is_valid_name(std::string_view name) {
  return !name.empty() && name.find('|') == std::string_view::npos;
}

}  // namespace

std::vector<tracked_unit> make_tracked_units(const temporal_policy& policy) {
  auto units = std::vector<tracked_unit>{};
  auto grouped = std::set<std::string, std::less<>>{};
  for (const auto& group : policy.composites) {
    units.push_back(tracked_unit{
        .name = group.name, .members = group.members, .composite = true});
    grouped.insert(std::begin(group.members), std::end(group.members));
  }
  for (const auto& attribute : policy.attributes) {
    if (grouped.contains(attribute.name)) {
      continue;
    }
    units.push_back(tracked_unit{.name = attribute.name,
                                 .members = {attribute.name},
                                 .composite = false});
  }
  return units;
}

const attribute_descriptor* find_attribute(const temporal_policy& policy,
                                           std::string_view name) {
  auto it = std::ranges::find_if(
      policy.attributes,
      [&](const attribute_descriptor& a) { return a.name == name; });
  if (it == std::end(policy.attributes)) {
    return nullptr;
  }
  return &*it;
}

void validate(const temporal_policy& policy) {
  if (!is_valid_name(policy.entity_type)) {
    throw std::invalid_argument{"entity type name must be non-empty and "
                                "must not contain '|'"};
  }
  if (policy.attributes.empty()) {
    throw std::invalid_argument{policy.entity_type +
                                " declares no tracked attributes"};
  }

  auto unit_names = std::set<std::string, std::less<>>{};
  for (const auto& attribute : policy.attributes) {
    if (!is_valid_name(attribute.name)) {
      throw std::invalid_argument{policy.entity_type +
                                  " has an invalid attribute name"};
    }
    if (!unit_names.insert(attribute.name).second) {
      throw std::invalid_argument{policy.entity_type +
                                  " declares attribute '" + attribute.name +
                                  "' twice"};
    }
  }

  auto grouped = std::set<std::string, std::less<>>{};
  for (const auto& group : policy.composites) {
    if (!is_valid_name(group.name)) {
      throw std::invalid_argument{policy.entity_type +
                                  " has an invalid composite name"};
    }
    if (group.members.size() < 2) {
      throw std::invalid_argument{"composite '" + group.name +
                                  "' needs at least two members"};
    }
    if (!unit_names.insert(group.name).second) {
      throw std::invalid_argument{"composite '" + group.name +
                                  "' collides with another tracked name"};
    }
    for (const auto& member : group.members) {
      if (find_attribute(policy, member) == nullptr) {
        throw std::invalid_argument{"composite '" + group.name +
                                    "' names undeclared attribute '" + member +
                                    "'"};
      }
      if (!grouped.insert(member).second) {
        throw std::invalid_argument{"attribute '" + member +
                                    "' belongs to more than one composite"};
      }
    }
  }
}

}  // namespace chronicle::schema
