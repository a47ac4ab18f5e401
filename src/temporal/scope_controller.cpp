#include <chronicle/errors/errors.hpp>
#include <chronicle/temporal/scope_controller.hpp>
#include <spdlog/spdlog.h>

namespace chronicle::temporal {

void scope_controller::enter(
    std::optional<chronicle::schema::activity_id_t> activity) {
  frames_.push_back(std::move(activity));
  spdlog::debug("Entered recording scope at depth {}", frames_.size());
}

void scope_controller::exit() {
  if (frames_.empty()) {
    spdlog::warn("Recording scope exited without a matching enter");
    throw chronicle::errors::scope_misuse_error{
        "recording scope exited without a matching enter"};
  }
  frames_.pop_back();
  if (frames_.empty()) {
    spdlog::debug("Recording scope batch of {} entity(ies) is ready",
                  batch_.size());
    batch_.clear();
  }
}

void scope_controller::touch(const entity_key& key) {
  if (frames_.empty()) {
    return;
  }
  batch_.insert(key);
}

bool scope_controller::is_pending(const entity_key& key) const {
  return batch_.contains(key);
}

std::optional<chronicle::schema::activity_id_t> scope_controller::activity()
    const {
  for (auto it = std::rbegin(frames_); it != std::rend(frames_); ++it) {
    if (*it) {
      return *it;
    }
  }
  return std::nullopt;
}

recording_scope::recording_scope(
    scope_controller& controller,
    std::optional<chronicle::schema::activity_id_t> activity)
    : controller_{controller} {
  controller_.enter(std::move(activity));
  depth_ = controller_.depth();
}

recording_scope::~recording_scope() {
  if (controller_.depth() < depth_) {
    spdlog::debug("Recording scope at depth {} was already exited", depth_);
    return;
  }
  controller_.exit();
}

}  // namespace chronicle::temporal
