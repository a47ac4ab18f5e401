#include <chronicle/errors/errors.hpp>
#include <chronicle/session/session.hpp>
#include <chronicle/temporal/change_set_detector.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

using namespace chronicle::schema;
using namespace chronicle::temporal;

namespace chronicle::session {

timestamp_milliseconds_t system_clock_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

session::session(encoding::scale_encoder_t& encoder,
                 const chronicle::storage::rocksdb_storage_t& storage,
                 const registry& registry,
                 session_options options)
    : registry_{registry},
      options_{std::move(options)},
      transaction_{storage.begin()},
      coordinator_{encoder, transaction_, scopes_, options_.strict},
      ledger_{encoder, transaction_},
      writer_{encoder, transaction_},
      snapshot_{encoder, transaction_} {
  if (!options_.clock) {
    throw std::invalid_argument{"session clock must be set"};
  }
  transaction_.on_before_commit([this]() {
    auto report = flush(true);
    spdlog::debug("Commit flush recorded {} entity version(s)",
                  report.recorded.size());
  });
}

entity& session::create(std::string_view entity_type,
                        const entity_id_t& entity_id,
                        attribute_values_t values,
                        std::optional<activity_id_t> activity) {
  const auto& type = registry_.at(entity_type);
  auto key = entity_key{entity_id, std::string{entity_type}};
  if (entities_.contains(key) ||
      snapshot_.get(type, entity_id, /*for_update=*/true)) {
    throw chronicle::errors::entity_exists_error{entity_type, entity_id};
  }
  for (const auto& [name, value] : values) {
    if (find_attribute(type.policy, name) == nullptr) {
      throw chronicle::errors::unknown_attribute_error{entity_type, name};
    }
  }
  for (const auto& attribute : type.policy.attributes) {
    if (attribute.default_value && !values.contains(attribute.name)) {
      values.emplace(attribute.name, *attribute.default_value);
    }
  }
  // Surface a partially supplied composite now rather than at flush.
  static_cast<void>(diff(type, {}, values));

  auto created = std::make_unique<entity>();
  created->type = &type;
  created->id = entity_id;
  created->vclock = 1;
  created->values = std::move(values);
  created->is_new = true;
  created->dirty = true;
  created->activity = activity ? activity : scopes_.activity();
  scopes_.touch(key);

  spdlog::debug("Created {} entity {}", entity_type, to_hex(entity_id));
  auto [it, inserted] = entities_.emplace(std::move(key), std::move(created));
  static_cast<void>(inserted);
  return *it->second;
}

entity& session::load(std::string_view entity_type,
                      const entity_id_t& entity_id) {
  const auto& type = registry_.at(entity_type);
  auto key = entity_key{entity_id, std::string{entity_type}};
  if (auto it = entities_.find(key); it != std::end(entities_)) {
    return *it->second;
  }
  auto record = snapshot_.get(type, entity_id, /*for_update=*/true);
  if (!record) {
    throw chronicle::errors::entity_missing_error{entity_type, entity_id};
  }

  auto loaded = std::make_unique<entity>();
  loaded->type = &type;
  loaded->id = entity_id;
  loaded->vclock = record->vclock;
  loaded->values = to_attribute_values(*record);
  loaded->baseline = loaded->values;

  spdlog::debug("Loaded {} entity {} at vclock {}", entity_type,
                to_hex(entity_id), loaded->vclock);
  auto [it, inserted] = entities_.emplace(std::move(key), std::move(loaded));
  static_cast<void>(inserted);
  return *it->second;
}

void session::set(entity& target, std::string_view attribute, value_t value) {
  require_tracked(target);
  if (find_attribute(target.type->policy, attribute) == nullptr) {
    throw chronicle::errors::unknown_attribute_error{
        target.type->policy.entity_type, attribute};
  }
  target.values.insert_or_assign(std::string{attribute}, std::move(value));
  target.dirty = true;
  if (!scopes_.active()) {
    if (!target.unscoped_attribute) {
      target.unscoped_attribute = std::string{attribute};
    }
    return;
  }
  scopes_.touch(target.key());
  if (auto activity = scopes_.activity()) {
    target.activity = std::move(activity);
  }
}

std::optional<value_t> session::get(const entity& target,
                                    std::string_view attribute) const {
  require_tracked(target);
  auto it = target.values.find(std::string{attribute});
  if (it == std::end(target.values)) {
    return std::nullopt;
  }
  return it->second;
}

void session::remove(const entity& target) {
  require_tracked(target);
  spdlog::warn("Refusing to delete {} entity {}",
               target.type->policy.entity_type, to_hex(target.id));
  throw chronicle::errors::delete_forbidden_error{
      target.type->policy.entity_type, target.id};
}

recording_scope session::scope(std::optional<activity_id_t> activity) {
  return recording_scope{scopes_, std::move(activity)};
}

void session::require_tracked(const entity& target) const {
  // Compare addresses only: a reference kept past commit() or rollback()
  // points at an entity that no longer exists.
  auto found = std::ranges::any_of(entities_, [&](const auto& entry) {
    return entry.second.get() == &target;
  });
  if (!found) {
    throw std::invalid_argument{"entity is not tracked by this session"};
  }
}

std::vector<entity*> session::tracked() {
  auto result = std::vector<entity*>{};
  result.reserve(entities_.size());
  for (auto& [key, tracked_entity] : entities_) {
    result.push_back(tracked_entity.get());
  }
  return result;
}

flush_report session::flush() {
  return flush(false);
}

flush_report session::flush(bool committing) {
  return coordinator_.flush(tracked(), options_.clock(), committing);
}

void session::commit() {
  if (scopes_.active() && !options_.allow_open_scope_at_commit) {
    spdlog::warn("Commit attempted with {} open recording scope(s)",
                 scopes_.depth());
    throw chronicle::errors::scope_misuse_error{
        "commit with " + std::to_string(scopes_.depth()) +
        " open recording scope(s)"};
  }
  transaction_.commit();
  spdlog::info("Committed session tracking {} entity(ies)", entities_.size());
  entities_.clear();
}

void session::rollback() {
  entities_.clear();
  transaction_.rollback();
  spdlog::debug("Rolled back session");
}

std::vector<clock_record_t> session::clock_records(const entity& target) {
  return ledger_.records(*target.type, target.id);
}

std::vector<history_row_t> session::history_rows(const entity& target,
                                                 std::string_view unit) {
  return writer_.rows(*target.type, unit, target.id);
}

}  // namespace chronicle::session
