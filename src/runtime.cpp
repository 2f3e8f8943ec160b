// =============================================================================
// runtime.cpp - Atomic call execution and event delivery
// =============================================================================

#include "isolend/runtime.hpp"

#include <algorithm>
#include <chrono>

namespace isolend {

Runtime::Runtime()
    : clock_([] {
          return static_cast<uint64_t>(
              std::chrono::duration_cast<std::chrono::seconds>(
                  std::chrono::system_clock::now().time_since_epoch()
              ).count()
          );
      }) {}

uint64_t Runtime::now() const {
    return clock_();
}

void Runtime::set_clock(Clock clock) {
    clock_ = std::move(clock);
}

void Runtime::register_state(Stateful* component) {
    if (std::find(participants_.begin(), participants_.end(), component) == participants_.end()) {
        participants_.push_back(component);
    }
}

void Runtime::unregister_state(Stateful* component) {
    participants_.erase(std::remove(participants_.begin(), participants_.end(), component),
                        participants_.end());
}

void Runtime::set_event_listener(EventListener* listener) {
    listener_ = listener;
}

void Runtime::emit(Event event) {
    event.timestamp = now();
    if (depth_ > 0) {
        pending_.push_back(std::move(event));
        return;
    }
    if (listener_) listener_->on_event(event);
}

Runtime::Checkpoint Runtime::checkpoint_all() const {
    Checkpoint saved;
    saved.reserve(participants_.size());
    for (Stateful* component : participants_) {
        saved.emplace_back(component, component->checkpoint());
    }
    return saved;
}

void Runtime::rollback(const Checkpoint& saved) {
    pending_.clear();
    // Components created during the call are not in `saved`; restoring
    // their owners drops them.
    for (const auto& [component, snapshot] : saved) {
        if (std::find(participants_.begin(), participants_.end(), component) != participants_.end()) {
            component->restore(snapshot);
        }
    }
}

void Runtime::commit(const char* call) {
    std::vector<Event> events;
    events.swap(pending_);
    if (!listener_) return;
    for (const auto& event : events) {
        listener_->on_event(event);
    }
    listener_->on_commit(call, events.size());
}

void Runtime::notify_revert(const char* call, int32_t code, const char* detail) {
    if (listener_) listener_->on_revert(call, code, detail);
}

} // namespace isolend
