#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/registry.hpp>
#include <compare>
#include <optional>
#include <string>

namespace chronicle::temporal {

/// Identity of an entity within a session; orders flush processing.
struct entity_key final {
  chronicle::schema::entity_id_t id{};
  std::string entity_type;

  auto operator<=>(const entity_key&) const = default;
};

/// In-memory state of one tracked entity: the values the application sees,
/// the snapshot they were last flushed as, and the bookkeeping the flush
/// needs. Owned by exactly one session.
struct entity final {
  const chronicle::schema::registered_type* type{nullptr};
  chronicle::schema::entity_id_t id{};
  /// Current version. 1 for an entity created in this session even before
  /// its first flush writes clock record 1.
  chronicle::schema::vclock_t vclock{};
  chronicle::schema::attribute_values_t values;
  chronicle::schema::attribute_values_t baseline;
  /// Created in this session and not flushed yet.
  bool is_new{false};
  bool dirty{false};
  /// First attribute assigned outside any recording scope since the last
  /// flush.
  std::optional<std::string> unscoped_attribute;
  /// Activity that stamps the next clock tick.
  std::optional<chronicle::schema::activity_id_t> activity;

  entity_key key() const { return entity_key{id, type->policy.entity_type}; }
};

}  // namespace chronicle::temporal
