#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/temporal/entity.hpp>
#include <cstddef>
#include <optional>
#include <set>
#include <vector>

namespace chronicle::temporal {

/// Nesting counter for recording scopes. Entities touched while a scope is
/// open form one batch; the batch becomes flushable only when the outermost
/// scope exits. Holds no persisted state.
class scope_controller final {
 public:
  /// Open a scope. A frame without an activity inherits the enclosing one.
  void enter(std::optional<chronicle::schema::activity_id_t> activity =
                 std::nullopt);

  /// Close the innermost scope. Throws scope_misuse_error at depth 0.
  void exit();

  std::size_t depth() const noexcept { return frames_.size(); }
  bool active() const noexcept { return !frames_.empty(); }

  /// Record that key was mutated. No-op when no scope is open.
  void touch(const entity_key& key);

  /// True while key belongs to the batch of a scope that is still open.
  bool is_pending(const entity_key& key) const;

  /// Innermost activity supplied by an open scope, if any.
  std::optional<chronicle::schema::activity_id_t> activity() const;

 private:
  std::vector<std::optional<chronicle::schema::activity_id_t>> frames_;
  std::set<entity_key> batch_;
};

/// Enters a scope on construction and exits it on destruction, whichever way
/// the enclosing block is left. A scope already closed by an explicit exit()
/// is not closed again.
class recording_scope final {
 public:
  explicit recording_scope(
      scope_controller& controller,
      std::optional<chronicle::schema::activity_id_t> activity = std::nullopt);
  ~recording_scope();

  recording_scope(const recording_scope&) = delete;
  recording_scope& operator=(const recording_scope&) = delete;
  recording_scope(recording_scope&&) = delete;
  recording_scope& operator=(recording_scope&&) = delete;

 private:
  scope_controller& controller_;
  std::size_t depth_{};
};

}  // namespace chronicle::temporal
