#include <chronicle/errors/errors.hpp>
#include <chronicle/temporal/change_set_detector.hpp>
#include <chronicle/temporal/flush_coordinator.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

using namespace chronicle::schema;

namespace chronicle::temporal {

namespace {

struct flush_plan final {
  entity* target{nullptr};
  change_set_t changes;
  vclock_t vclock{};
};

}  // namespace

flush_coordinator::flush_coordinator(
    encoding::scale_encoder_t& encoder,
    chronicle::storage::rocksdb_transaction_t& transaction,
    const scope_controller& scopes,
    bool strict)
    : transaction_{transaction},
      scopes_{scopes},
      strict_{strict},
      ledger_{encoder, transaction},
      writer_{encoder, transaction},
      snapshot_{encoder, transaction} {}

flush_report flush_coordinator::flush(const std::vector<entity*>& entities,
                                      timestamp_milliseconds_t at_time,
                                      bool committing) {
  auto report = flush_report{.at_time = at_time};

  auto pending = std::vector<entity*>{};
  for (auto target : entities) {
    if (!target->dirty && !target->is_new) {
      continue;
    }
    auto key = target->key();
    if ((!committing && scopes_.is_pending(key)) ||
        (target->type->policy.persist_on_commit && !committing)) {
      report.deferred.push_back(std::move(key));
      continue;
    }
    pending.push_back(target);
  }
  std::sort(std::begin(pending), std::end(pending),
            [](const entity* lhs, const entity* rhs) {
              return lhs->key() < rhs->key();
            });

  // Rejections happen before the first write so a failed flush never needs
  // to undo anything it did for another entity.
  for (auto target : pending) {
    if (target->unscoped_attribute &&
        (target->type->policy.scope_required || strict_)) {
      spdlog::warn("Rejecting unscoped mutation of {}.{} on {}",
                   target->type->policy.entity_type,
                   *target->unscoped_attribute, to_hex(target->id));
      throw chronicle::errors::unscoped_mutation_error{
          target->type->policy.entity_type, target->id,
          *target->unscoped_attribute};
    }
  }

  auto plans = std::vector<flush_plan>{};
  auto unchanged = std::vector<entity*>{};
  for (auto target : pending) {
    auto changes = diff(*target);
    if (changes.empty() && !target->is_new) {
      unchanged.push_back(target);
      continue;
    }
    if (target->type->policy.activity_required && !target->activity) {
      spdlog::warn("No activity for {} entity {}",
                   target->type->policy.entity_type, to_hex(target->id));
      throw chronicle::errors::missing_activity_error{
          target->type->policy.entity_type, target->id};
    }
    auto vclock = target->is_new ? vclock_t{1} : target->vclock + 1;
    plans.push_back(flush_plan{
        .target = target, .changes = std::move(changes), .vclock = vclock});
  }

  transaction_.set_save_point();
  try {
    for (const auto& plan : plans) {
      const auto& type = *plan.target->type;
      writer_.record(type, plan.target->id, plan.vclock, at_time,
                     plan.changes);
      auto advanced = ledger_.advance(type, plan.target->id, at_time,
                                      plan.target->activity);
      if (advanced != plan.vclock) {
        spdlog::warn("{} entity {} is at vclock {} in the store, expected {}",
                     type.policy.entity_type, to_hex(plan.target->id),
                     advanced - 1, plan.vclock - 1);
        throw chronicle::errors::concurrent_modification_error{
            type.policy.entity_type + " entity " + to_hex(plan.target->id) +
            " advanced to vclock " + std::to_string(advanced) +
            " instead of " + std::to_string(plan.vclock)};
      }
      snapshot_.put(type, plan.target->id, advanced, plan.target->values);
      spdlog::debug("Flushed {} entity {} at vclock {} ({} unit(s) changed)",
                    type.policy.entity_type, to_hex(plan.target->id),
                    advanced, plan.changes.size());
    }
  } catch (const std::exception& e) {
    spdlog::warn("Flush failed, undoing its writes: {}", e.what());
    transaction_.rollback_to_save_point();
    throw;
  }
  transaction_.pop_save_point();

  for (auto& plan : plans) {
    auto& target = *plan.target;
    target.vclock = plan.vclock;
    target.baseline = target.values;
    target.is_new = false;
    target.dirty = false;
    target.unscoped_attribute.reset();
    target.activity.reset();
    report.recorded.push_back(recorded_version{
        .key = target.key(),
        .vclock = plan.vclock,
        .changed_units = plan.changes.size()});
  }
  for (auto target : unchanged) {
    target->dirty = false;
    target->unscoped_attribute.reset();
    target->activity.reset();
  }
  return report;
}

}  // namespace chronicle::temporal
