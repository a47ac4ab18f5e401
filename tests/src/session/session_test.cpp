#include <chronicle/errors/errors.hpp>
#include <chronicle/session/session.hpp>
#include <chronicle/testing/session_fixture.hpp>
#include <gtest/gtest.h>

#include <stdexcept>

namespace {

using chronicle::schema::unit_values_t;
using chronicle::testing::make_hash;
using chronicle::testing::number;
using chronicle::testing::text;

}  // namespace

TEST(session, scoped_update_closes_the_first_row_and_opens_a_second) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_scenario"};
  auto id = make_hash(1);
  {
    auto session = fixture.begin();
    auto& document = session->create(
        "document", id, {{"description", text("first description")}});
    EXPECT_EQ(document.vclock, 1u);
    session->flush();

    fixture.clock().now = 1'500;
    {
      auto scope = session->scope();
      session->set(document, "description", text("second description"));
    }
    auto report = session->flush();
    ASSERT_EQ(report.recorded.size(), 1u);
    EXPECT_EQ(report.recorded[0].vclock, 2u);
    EXPECT_EQ(document.vclock, 2u);
    session->commit();
  }

  auto rows = fixture.reader().history_rows("document", "description", id);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].vclock, 1u);
  EXPECT_EQ(rows[0].values, unit_values_t{text("first description")});
  EXPECT_EQ(rows[0].tick_start, 1'000u);
  EXPECT_EQ(rows[0].tick_end, 1'500u);
  EXPECT_EQ(rows[1].vclock, 2u);
  EXPECT_EQ(rows[1].values, unit_values_t{text("second description")});
  EXPECT_EQ(rows[1].tick_start, 1'500u);
  EXPECT_FALSE(rows[1].tick_end.has_value());

  auto clock = fixture.reader().clock_records("document", id);
  ASSERT_EQ(clock.size(), 2u);
  EXPECT_EQ(clock[0].tick_end, clock[1].tick_start);
  EXPECT_FALSE(clock[1].tick_end.has_value());
}

TEST(session, unset_attribute_writes_no_row_but_explicit_null_does) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_null"};
  {
    auto session = fixture.begin();
    session->create("document", make_hash(1));
    session->create("document", make_hash(2),
                    {{"description", std::nullopt}});
    session->commit();
  }

  EXPECT_TRUE(fixture.reader()
                  .history_rows("document", "description", make_hash(1))
                  .empty());
  auto rows =
      fixture.reader().history_rows("document", "description", make_hash(2));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].values, unit_values_t{std::nullopt});
}

TEST(session, declared_defaults_are_recorded_at_creation) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_defaults"};
  {
    auto session = fixture.begin();
    auto& document = session->create("document", make_hash(1));
    auto title = session->get(document, "title");
    ASSERT_TRUE(title.has_value());
    EXPECT_EQ(*title, text("untitled"));
    EXPECT_FALSE(session->get(document, "description").has_value());
    session->commit();
  }
  auto rows = fixture.reader().history_rows("document", "title", make_hash(1));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].vclock, 1u);
  EXPECT_EQ(rows[0].values, unit_values_t{text("untitled")});
}

TEST(session, nested_scopes_produce_a_single_version) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_nested"};
  auto session = fixture.begin();
  auto& account = session->create("account", make_hash(1),
                                  {{"owner", text("ada")}});
  session->flush();

  fixture.clock().advance(10);
  {
    auto outer = session->scope();
    session->set(account, "owner", text("grace"));
    {
      auto inner = session->scope();
      session->set(account, "balance", number(30));
    }
    EXPECT_TRUE(session->flush().recorded.empty());
  }
  auto report = session->flush();
  ASSERT_EQ(report.recorded.size(), 1u);
  EXPECT_EQ(report.recorded[0].changed_units, 2u);
  EXPECT_EQ(account.vclock, 2u);
  EXPECT_EQ(session->clock_records(account).size(), 2u);
}

TEST(session, unscoped_mutation_is_rejected_and_leaves_the_version_alone) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_unscoped"};
  auto session = fixture.begin();
  auto& account = session->create("account", make_hash(1),
                                  {{"owner", text("ada")}});
  session->flush();

  fixture.clock().advance(10);
  session->set(account, "balance", number(5));
  try {
    session->flush();
    FAIL() << "expected unscoped_mutation_error";
  } catch (const chronicle::errors::unscoped_mutation_error& e) {
    EXPECT_EQ(e.entity_type(), "account");
    EXPECT_EQ(e.entity_id(), make_hash(1));
    EXPECT_EQ(e.attribute(), "balance");
  }
  EXPECT_EQ(account.vclock, 1u);
  EXPECT_EQ(session->clock_records(account).size(), 1u);
  EXPECT_EQ(session->history_rows(account, "balance").size(), 1u);
}

TEST(session, strict_mode_enforces_scopes_for_every_type) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_strict"};
  auto session = fixture.begin({.strict = true});
  auto& document = session->create("document", make_hash(1));
  session->flush();

  session->set(document, "description", text("unscoped"));
  EXPECT_THROW(session->flush(), chronicle::errors::unscoped_mutation_error);
}

TEST(session, new_entity_set_outside_a_scope_follows_the_scope_rule) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_new_unscoped"};
  auto session = fixture.begin();
  auto& account = session->create("account", make_hash(1));
  session->set(account, "owner", text("ada"));
  EXPECT_THROW(session->flush(), chronicle::errors::unscoped_mutation_error);
}

TEST(session, composite_groups_are_recorded_as_one_unit) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_composite"};
  auto id = make_hash(1);
  {
    auto session = fixture.begin();
    auto& location = session->create("location", id,
                                     {{"label", text("home")},
                                      {"latitude", number(10)},
                                      {"longitude", number(20)}});
    session->flush();

    fixture.clock().advance(10);
    session->set(location, "longitude", number(21));
    session->flush();

    fixture.clock().advance(10);
    session->set(location, "label", text("office"));
    session->flush();
    EXPECT_EQ(location.vclock, 3u);
    session->commit();
  }

  auto position = fixture.reader().history_rows("location", "position", id);
  ASSERT_EQ(position.size(), 2u);
  EXPECT_EQ(position[0].values, (unit_values_t{number(10), number(20)}));
  EXPECT_EQ(position[1].values, (unit_values_t{number(10), number(21)}));
  EXPECT_EQ(position[1].vclock, 2u);
  EXPECT_FALSE(position[1].tick_end.has_value());
  EXPECT_EQ(fixture.reader().history_rows("location", "label", id).size(), 2u);
}

TEST(session, partially_supplied_composite_is_an_integrity_error) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_partial"};
  auto session = fixture.begin();
  EXPECT_THROW(
      session->create("location", make_hash(1), {{"latitude", number(1)}}),
      chronicle::errors::composite_integrity_error);

  auto& location =
      session->create("location", make_hash(2), {{"label", text("x")}});
  session->set(location, "latitude", number(4));
  EXPECT_THROW(session->flush(), chronicle::errors::composite_integrity_error);
  session->set(location, "longitude", number(5));
  EXPECT_NO_THROW(session->flush());
  EXPECT_EQ(session->history_rows(location, "position").size(), 1u);
}

TEST(session, repeated_flushes_without_changes_do_not_bump_the_version) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_idempotent"};
  auto session = fixture.begin();
  auto& document = session->create("document", make_hash(1),
                                   {{"description", text("same")}});
  session->flush();
  fixture.clock().advance(10);
  EXPECT_TRUE(session->flush().recorded.empty());

  session->set(document, "description", text("same"));
  EXPECT_TRUE(session->flush().recorded.empty());
  EXPECT_EQ(document.vclock, 1u);
  EXPECT_EQ(session->history_rows(document, "description").size(), 1u);
}

TEST(session, vclock_counts_flushes_that_change_the_entity) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_gapless"};
  auto session = fixture.begin();
  auto& document = session->create("document", make_hash(1));
  session->flush();
  for (auto i = 0; i < 5; ++i) {
    fixture.clock().advance(100);
    session->set(document, "description", number(i));
    session->flush();
  }
  EXPECT_EQ(document.vclock, 6u);

  auto records = session->clock_records(document);
  ASSERT_EQ(records.size(), 6u);
  for (std::size_t i = 0; i < records.size(); ++i) {
    EXPECT_EQ(records[i].vclock, i + 1);
    if (i + 1 < records.size()) {
      EXPECT_EQ(records[i].tick_end, records[i + 1].tick_start);
    }
  }
  auto rows = session->history_rows(document, "description");
  ASSERT_EQ(rows.size(), 5u);
  EXPECT_EQ(rows.front().vclock, 2u);
  EXPECT_FALSE(rows.back().tick_end.has_value());
}

TEST(session, clock_moving_backwards_fails_the_flush_atomically) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_out_of_order"};
  auto session = fixture.begin();
  auto& first = session->create("document", make_hash(1));
  auto& second = session->create("document", make_hash(2));
  session->flush();

  fixture.clock().now = 900;
  session->set(first, "description", text("late"));
  session->set(second, "description", text("late"));
  EXPECT_THROW(session->flush(), chronicle::errors::out_of_order_error);
  EXPECT_EQ(first.vclock, 1u);
  EXPECT_EQ(session->history_rows(first, "description").size(), 0u);
  EXPECT_EQ(session->clock_records(first).size(), 1u);

  fixture.clock().now = 1'200;
  auto report = session->flush();
  EXPECT_EQ(report.recorded.size(), 2u);
  EXPECT_EQ(first.vclock, 2u);
  EXPECT_EQ(second.vclock, 2u);
}

TEST(session, concurrent_commits_to_one_entity_conflict) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_conflict"};
  auto id = make_hash(1);
  {
    auto session = fixture.begin();
    session->create("document", id, {{"description", text("base")}});
    session->commit();
  }

  fixture.clock().advance(10);
  auto first = fixture.begin();
  auto second = fixture.begin();
  auto& mine = first->load("document", id);
  auto& theirs = second->load("document", id);
  first->set(mine, "description", text("mine"));
  second->set(theirs, "description", text("theirs"));

  first->commit();
  EXPECT_THROW(second->commit(),
               chronicle::errors::concurrent_modification_error);

  auto rows = fixture.reader().history_rows("document", "description", id);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1].values, unit_values_t{text("mine")});
}

TEST(session, flush_defers_entities_of_an_open_scope) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_deferred"};
  auto session = fixture.begin();
  auto& document = session->create("document", make_hash(1));
  session->flush();

  fixture.clock().advance(10);
  session->scopes().enter();
  session->set(document, "description", text("pending"));
  auto report = session->flush();
  EXPECT_TRUE(report.recorded.empty());
  ASSERT_EQ(report.deferred.size(), 1u);
  EXPECT_EQ(report.deferred[0], document.key());
  EXPECT_THROW(session->commit(), chronicle::errors::scope_misuse_error);

  session->scopes().exit();
  EXPECT_EQ(session->flush().recorded.size(), 1u);
  EXPECT_THROW(session->scopes().exit(), chronicle::errors::scope_misuse_error);
}

TEST(session, commit_may_flush_an_open_scope_when_allowed) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_open_commit"};
  auto id = make_hash(1);
  {
    auto session = fixture.begin({.allow_open_scope_at_commit = true});
    auto scope = session->scope();
    session->create("document", id, {{"description", text("inside")}});
    session->commit();
  }
  EXPECT_EQ(fixture.reader().clock_records("document", id).size(), 1u);
}

TEST(session, activity_is_required_and_stamped_on_the_clock) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_activity"};
  auto session = fixture.begin();

  auto& unstamped = session->create("ledger_entry", make_hash(1),
                                    {{"amount", number(1)}});
  EXPECT_THROW(session->flush(), chronicle::errors::missing_activity_error);
  EXPECT_TRUE(unstamped.is_new);
  session->rollback();
}

TEST(session, scope_activity_stamps_each_tick_once) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_activity_scope"};
  auto session = fixture.begin();
  auto& entry = session->create("ledger_entry", make_hash(1),
                                {{"amount", number(1)}}, make_hash(50));
  session->flush();

  fixture.clock().advance(10);
  {
    auto scope = session->scope(make_hash(51));
    session->set(entry, "amount", number(2));
  }
  session->flush();
  auto records = session->clock_records(entry);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].activity_id, make_hash(50));
  EXPECT_EQ(records[1].activity_id, make_hash(51));

  fixture.clock().advance(10);
  {
    auto scope = session->scope(make_hash(51));
    session->set(entry, "amount", number(3));
  }
  EXPECT_THROW(session->flush(), chronicle::errors::duplicate_activity_error);
  EXPECT_EQ(entry.vclock, 2u);
}

TEST(session, activity_of_a_flush_without_changes_does_not_carry_over) {
  auto fixture =
      chronicle::testing::session_fixture{"chronicle_activity_reset"};
  auto session = fixture.begin();
  auto& entry = session->create("ledger_entry", make_hash(1),
                                {{"amount", number(1)}}, make_hash(50));
  session->flush();

  fixture.clock().advance(10);
  {
    auto scope = session->scope(make_hash(51));
    session->set(entry, "amount", number(1));
  }
  auto report = session->flush();
  EXPECT_TRUE(report.recorded.empty());
  EXPECT_FALSE(entry.activity.has_value());

  fixture.clock().advance(10);
  {
    auto scope = session->scope();
    session->set(entry, "amount", number(2));
  }
  EXPECT_THROW(session->flush(), chronicle::errors::missing_activity_error);
  EXPECT_EQ(entry.vclock, 1u);
  EXPECT_EQ(session->clock_records(entry).size(), 1u);
  session->rollback();
}

TEST(session, entities_cannot_be_deleted) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_delete"};
  auto session = fixture.begin();
  auto& document = session->create("document", make_hash(1));
  EXPECT_THROW(session->remove(document),
               chronicle::errors::delete_forbidden_error);
  EXPECT_EQ(session->flush().recorded.size(), 1u);
}

TEST(session, persist_on_commit_records_only_the_last_value_at_commit) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_on_commit"};
  auto id = make_hash(1);
  {
    auto session = fixture.begin();
    auto& report = session->create("report", id, {{"status", text("draft")}});
    auto& document = session->create("document", make_hash(2));
    auto flushed = session->flush();
    ASSERT_EQ(flushed.recorded.size(), 1u);
    EXPECT_EQ(flushed.recorded[0].key, document.key());
    ASSERT_EQ(flushed.deferred.size(), 1u);

    session->set(report, "status", text("review"));
    session->set(report, "status", text("final"));
    EXPECT_TRUE(session->flush().recorded.empty());
    EXPECT_TRUE(fixture.reader().clock_records("report", id).empty());
    session->commit();
  }

  auto rows = fixture.reader().history_rows("report", "status", id);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].values, unit_values_t{text("final")});
}

TEST(session, load_uses_the_last_flushed_values_as_baseline) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_load"};
  auto id = make_hash(1);
  {
    auto session = fixture.begin();
    session->create("document", id, {{"description", text("base")}});
    session->commit();
  }
  fixture.clock().advance(10);
  {
    auto session = fixture.begin();
    auto& document = session->load("document", id);
    EXPECT_EQ(document.vclock, 1u);
    EXPECT_FALSE(document.is_new);
    auto description = session->get(document, "description");
    ASSERT_TRUE(description.has_value());
    EXPECT_EQ(*description, text("base"));

    session->set(document, "description", text("base"));
    EXPECT_TRUE(session->flush().recorded.empty());
    session->set(document, "description", text("changed"));
    session->commit();
  }
  auto current = fixture.reader().current("document", id);
  ASSERT_TRUE(current.has_value());
  EXPECT_EQ(current->vclock, 2u);
  EXPECT_EQ(fixture.reader().history_rows("document", "title", id).size(), 1u);
}

TEST(session, identity_and_attribute_errors) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_identity"};
  {
    auto session = fixture.begin();
    auto& document = session->create("document", make_hash(1));
    EXPECT_THROW(session->create("document", make_hash(1)),
                 chronicle::errors::entity_exists_error);
    EXPECT_THROW(session->set(document, "colour", text("red")),
                 chronicle::errors::unknown_attribute_error);
    EXPECT_THROW(
        session->create("document", make_hash(2), {{"colour", text("red")}}),
        chronicle::errors::unknown_attribute_error);
    EXPECT_THROW(session->load("document", make_hash(3)),
                 chronicle::errors::entity_missing_error);
    EXPECT_THROW(session->create("unregistered", make_hash(4)),
                 std::out_of_range);
    session->commit();
  }
  auto session = fixture.begin();
  EXPECT_THROW(session->create("document", make_hash(1)),
               chronicle::errors::entity_exists_error);
}

TEST(session, entities_of_another_session_are_rejected) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_ownership"};
  auto owner = fixture.begin();
  auto other = fixture.begin();
  auto& document =
      owner->create("document", make_hash(1), {{"description", text("x")}});

  EXPECT_THROW(other->set(document, "description", text("y")),
               std::invalid_argument);
  EXPECT_THROW(other->get(document, "description"),
               std::invalid_argument);
  EXPECT_THROW(other->remove(document), std::invalid_argument);

  auto description = owner->get(document, "description");
  ASSERT_TRUE(description.has_value());
  EXPECT_EQ(*description, text("x"));
  owner->rollback();
  other->rollback();
}

TEST(session, rollback_discards_flushed_history) {
  auto fixture = chronicle::testing::session_fixture{"chronicle_rollback"};
  {
    auto session = fixture.begin();
    session->create("document", make_hash(1), {{"description", text("x")}});
    session->flush();
    session->rollback();
    EXPECT_FALSE(session->is_open());
  }
  EXPECT_TRUE(fixture.reader().clock_records("document", make_hash(1)).empty());
}
