#pragma once

#include <chronicle/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: temporal policy.
// What an entity type declares about its history: which attributes are
// tracked, which of them are versioned together as composite groups, and how
// strictly mutations must be scoped.
namespace chronicle::schema {

struct attribute_descriptor final {
  std::string name;
  /// Declared default materialised at creation when the creator does not
  /// supply the attribute. Empty means "no default": the attribute stays
  /// unset and writes no history row until assigned.
  std::optional<value_t> default_value;
};

struct composite_group final {
  std::string name;
  std::vector<std::string> members;
};

struct temporal_policy final {
  std::string entity_type;
  std::vector<attribute_descriptor> attributes;
  std::vector<composite_group> composites;
  bool scope_required{false};
  bool activity_required{false};
  bool persist_on_commit{false};
};

/// A single attribute, or a composite group, versioned as one history table.
struct tracked_unit final {
  std::string name;
  std::vector<std::string> members;
  bool composite{false};
};

/// Expand a policy into its tracked units: one per composite group (in
/// declaration order) followed by one per attribute not in any group.
std::vector<tracked_unit> make_tracked_units(const temporal_policy& policy);

const attribute_descriptor* find_attribute(const temporal_policy& policy,
                                           std::string_view name);

/// Throws std::invalid_argument describing the first problem found.
void validate(const temporal_policy& policy);

}  // namespace chronicle::schema
