#include <gtest/gtest.h>
#include <chronicle/schema/key/table_keys.hpp>
#include <chronicle/schema/registry.hpp>
#include <chronicle/schema/temporal_error_code.hpp>
#include <chronicle/schema/temporal_policy.hpp>

#include <algorithm>
#include <stdexcept>

namespace {

using chronicle::schema::attribute_descriptor;
using chronicle::schema::composite_group;
using chronicle::schema::temporal_policy;

temporal_policy make_location_policy() {
  auto policy = temporal_policy{};
  policy.entity_type = "location";
  policy.attributes = {attribute_descriptor{.name = "label"},
                       attribute_descriptor{.name = "latitude"},
                       attribute_descriptor{.name = "longitude"}};
  policy.composites = {
      composite_group{.name = "position", .members = {"latitude", "longitude"}}};
  return policy;
}

}  // namespace

TEST(temporal_policy, composites_come_first_then_ungrouped_attributes) {
  auto units = chronicle::schema::make_tracked_units(make_location_policy());
  ASSERT_EQ(units.size(), 2u);
  EXPECT_EQ(units[0].name, "position");
  EXPECT_TRUE(units[0].composite);
  EXPECT_EQ(units[0].members,
            (std::vector<std::string>{"latitude", "longitude"}));
  EXPECT_EQ(units[1].name, "label");
  EXPECT_FALSE(units[1].composite);
}

TEST(temporal_policy, validate_rejects_malformed_policies) {
  auto no_attributes = temporal_policy{.entity_type = "empty"};
  EXPECT_THROW(chronicle::schema::validate(no_attributes),
               std::invalid_argument);

  auto bad_name = make_location_policy();
  bad_name.entity_type = "loc|ation";
  EXPECT_THROW(chronicle::schema::validate(bad_name), std::invalid_argument);

  auto duplicate = make_location_policy();
  duplicate.attributes.push_back(attribute_descriptor{.name = "label"});
  EXPECT_THROW(chronicle::schema::validate(duplicate), std::invalid_argument);

  auto single_member = make_location_policy();
  single_member.composites = {
      composite_group{.name = "position", .members = {"latitude"}}};
  EXPECT_THROW(chronicle::schema::validate(single_member),
               std::invalid_argument);

  auto undeclared = make_location_policy();
  undeclared.composites = {
      composite_group{.name = "position", .members = {"latitude", "altitude"}}};
  EXPECT_THROW(chronicle::schema::validate(undeclared), std::invalid_argument);

  auto collision = make_location_policy();
  collision.composites = {
      composite_group{.name = "label", .members = {"latitude", "longitude"}}};
  EXPECT_THROW(chronicle::schema::validate(collision), std::invalid_argument);

  auto shared_member = make_location_policy();
  shared_member.composites.push_back(
      composite_group{.name = "other", .members = {"latitude", "label"}});
  EXPECT_THROW(chronicle::schema::validate(shared_member),
               std::invalid_argument);
}

TEST(registry, add_derives_one_history_table_per_unit) {
  auto registry = chronicle::schema::registry{};
  const auto& type = registry.add(make_location_policy());

  EXPECT_EQ(type.history_tables.size(), 2u);
  EXPECT_EQ(type.unit_of_attribute.at("latitude"), "position");
  EXPECT_EQ(type.unit_of_attribute.at("label"), "label");
  EXPECT_EQ(registry.table_for("location", "position"),
            chronicle::schema::key::make_history_table("location", "position"));
  EXPECT_NE(registry.table_for("location", "position"),
            registry.table_for("location", "label"));
  EXPECT_EQ(type.clock_table,
            chronicle::schema::key::make_clock_table("location"));
  EXPECT_EQ(registry.policy("location").composites.size(), 1u);
}

TEST(registry, lookups_of_unknown_names_fail) {
  auto registry = chronicle::schema::registry{};
  registry.add(make_location_policy());

  EXPECT_EQ(registry.find("missing"), nullptr);
  EXPECT_THROW(registry.at("missing"), std::out_of_range);
  EXPECT_THROW(registry.table_for("location", "latitude"), std::out_of_range);
  EXPECT_THROW(registry.add(make_location_policy()), std::invalid_argument);
}

TEST(registry, entity_types_lists_registered_names_in_order) {
  auto registry = chronicle::schema::registry{};
  auto second = make_location_policy();
  second.entity_type = "area";
  registry.add(make_location_policy());
  registry.add(std::move(second));

  EXPECT_EQ(registry.entity_types(),
            (std::vector<std::string>{"area", "location"}));
}

TEST(table_keys, table_prefixes_depend_on_keyspace_and_names) {
  using namespace chronicle::schema::key;
  // Both hash "a|b|c"; validate() rejects names containing '|'.
  EXPECT_EQ(make_history_table("a", "b|c"), make_history_table("a|b", "c"));
  EXPECT_EQ(make_clock_table("a").size(), kClockPrefix.size() + 32u);
  EXPECT_NE(make_clock_table("a"), make_entity_table("a"));
  EXPECT_NE(make_history_table("a", "x"), make_history_table("b", "x"));
}

TEST(table_keys, row_keys_order_by_vclock) {
  using namespace chronicle::schema::key;
  auto table = make_clock_table("document");
  auto id = chronicle::schema::make_zero_hash();
  auto v2 = make_row_key(table, id, 2);
  auto v10 = make_row_key(table, id, 10);
  auto v256 = make_row_key(table, id, 256);
  EXPECT_LT(v2, v10);
  EXPECT_LT(v10, v256);
  auto prefix = make_row_prefix(table, id);
  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix), std::begin(v2)));
}

TEST(temporal_error_code, string_mapping_round_trips) {
  using chronicle::schema::temporal_error_code;
  EXPECT_EQ(chronicle::schema::to_string(temporal_error_code::out_of_order),
            "out_of_order");
  EXPECT_EQ(chronicle::schema::try_from_string<temporal_error_code>(
                "concurrent_modification"),
            temporal_error_code::concurrent_modification);
  EXPECT_FALSE(chronicle::schema::try_from_string<temporal_error_code>(
                   "not_an_error")
                   .has_value());
}
