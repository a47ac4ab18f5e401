#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/temporal_policy.hpp>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::schema {

/// A validated policy plus the tables its history lives in.
struct registered_type final {
  temporal_policy policy;
  std::vector<tracked_unit> units;
  bytes_t clock_table;
  bytes_t entity_table;
  /// Tracked unit name -> history table prefix.
  std::map<std::string, bytes_t, std::less<>> history_tables;
  /// Attribute name -> name of the tracked unit that records it.
  std::map<std::string, std::string, std::less<>> unit_of_attribute;
};

/// Entity type -> policy and table mapping, built once at schema-setup time
/// and handed to every session that records history for those types.
class registry final {
 public:
  /// Validate and register a policy. Throws std::invalid_argument for an
  /// invalid policy or a type that is already registered.
  const registered_type& add(temporal_policy policy);

  /// Lookup; nullptr when the type was never registered.
  const registered_type* find(std::string_view entity_type) const;

  /// Lookup; throws std::out_of_range when the type was never registered.
  const registered_type& at(std::string_view entity_type) const;

  /// Policy of a registered type; throws std::out_of_range.
  const temporal_policy& policy(std::string_view entity_type) const;

  /// History table prefix of a tracked unit; throws std::out_of_range.
  const bytes_t& table_for(std::string_view entity_type,
                           std::string_view unit) const;

  std::vector<std::string> entity_types() const;

 private:
  // Stable addresses: sessions keep pointers to registered types.
  std::map<std::string, std::unique_ptr<registered_type>, std::less<>> types_;
};

}  // namespace chronicle::schema
