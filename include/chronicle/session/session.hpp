#pragma once

#include <chronicle/schema/clock_record.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/history_row.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/registry.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/storage/rocksdb/transaction.hpp>
#include <chronicle/temporal/clock_ledger.hpp>
#include <chronicle/temporal/entity.hpp>
#include <chronicle/temporal/entity_snapshot.hpp>
#include <chronicle/temporal/flush_coordinator.hpp>
#include <chronicle/temporal/history_writer.hpp>
#include <chronicle/temporal/scope_controller.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::session {

/// Milliseconds since the Unix epoch from the system clock.
chronicle::schema::timestamp_milliseconds_t system_clock_milliseconds();

struct session_options final {
  /// Source of the at_time stamped on each flush.
  std::function<chronicle::schema::timestamp_milliseconds_t()> clock{
      &system_clock_milliseconds};
  /// Enforce recording scopes for every entity type, not only those whose
  /// policy requires them.
  bool strict{false};
  /// Let commit() flush the batch of a scope that is still open instead of
  /// raising scope_misuse_error.
  bool allow_open_scope_at_commit{false};
};

/// Unit of work over temporal entities: one store transaction, the entities
/// it tracks, and the recording scopes open on it.
///
/// Mutations stay in memory until flush() or commit(). commit() flushes
/// through the transaction's before-commit hook, so history rows, clock
/// records and entity rows land in the same atomic commit as each other.
/// Entity references handed out stay valid until commit() or rollback().
class session final {
 public:
  session(chronicle::schema::encoding::scale_encoder_t& encoder,
          const chronicle::storage::rocksdb_storage_t& storage,
          const chronicle::schema::registry& registry,
          session_options options = {});

  session(const session&) = delete;
  session& operator=(const session&) = delete;
  session(session&&) = delete;
  session& operator=(session&&) = delete;

  /// Track a new entity at vclock 1. Declared defaults fill attributes the
  /// caller leaves out. The activity defaults to the innermost open scope's.
  ///
  /// Throws entity_exists_error, unknown_attribute_error, or
  /// composite_integrity_error for a partially supplied composite group.
  temporal::entity& create(
      std::string_view entity_type,
      const chronicle::schema::entity_id_t& entity_id,
      chronicle::schema::attribute_values_t values = {},
      std::optional<chronicle::schema::activity_id_t> activity =
          std::nullopt);

  /// Track an existing entity with its last flushed values as baseline. The
  /// entity row is read for update, so a concurrent commit to the same
  /// entity fails this session's commit. Throws entity_missing_error.
  temporal::entity& load(std::string_view entity_type,
                         const chronicle::schema::entity_id_t& entity_id);

  /// Assign an attribute. Outside any recording scope the assignment is
  /// remembered as unscoped; the flush decides whether that is allowed.
  /// Throws std::invalid_argument for an entity this session does not
  /// track, including one handed out before the last commit() or rollback().
  void set(temporal::entity& target,
           std::string_view attribute,
           chronicle::schema::value_t value);

  /// Current value; std::nullopt when the attribute is unset.
  std::optional<chronicle::schema::value_t> get(
      const temporal::entity& target,
      std::string_view attribute) const;

  /// Temporal entities are never deleted: always throws
  /// delete_forbidden_error.
  [[noreturn]] void remove(const temporal::entity& target);

  /// Open a recording scope for the lifetime of the returned guard.
  [[nodiscard]] temporal::recording_scope scope(
      std::optional<chronicle::schema::activity_id_t> activity =
          std::nullopt);

  temporal::scope_controller& scopes() noexcept { return scopes_; }

  /// Record pending changes of entities whose scopes have closed.
  temporal::flush_report flush();

  /// Flush everything and commit. Throws scope_misuse_error while a scope
  /// is open (unless allowed by the options) and
  /// concurrent_modification_error when the store detects a conflict.
  void commit();

  void rollback();

  bool is_open() const noexcept { return transaction_.is_open(); }

  /// Clock records of an entity as seen by this session's transaction.
  std::vector<chronicle::schema::clock_record_t> clock_records(
      const temporal::entity& target);

  /// History rows of one tracked unit as seen by this session's transaction.
  std::vector<chronicle::schema::history_row_t> history_rows(
      const temporal::entity& target,
      std::string_view unit);

 private:
  temporal::flush_report flush(bool committing);
  std::vector<temporal::entity*> tracked();
  /// Throws std::invalid_argument unless target is owned by this session.
  void require_tracked(const temporal::entity& target) const;

  const chronicle::schema::registry& registry_;
  session_options options_;
  chronicle::storage::rocksdb_transaction_t transaction_;
  temporal::scope_controller scopes_;
  temporal::flush_coordinator coordinator_;
  temporal::clock_ledger ledger_;
  temporal::history_writer writer_;
  temporal::entity_snapshot snapshot_;
  std::map<temporal::entity_key, std::unique_ptr<temporal::entity>> entities_;
};

}  // namespace chronicle::session
