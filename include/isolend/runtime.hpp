#ifndef ISOLEND_RUNTIME_HPP
#define ISOLEND_RUNTIME_HPP

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "events.hpp"
#include "types.hpp"

namespace isolend {

// =============================================================================
// Stateful - component whose state can be checkpointed and restored
// =============================================================================

class Stateful {
public:
    virtual ~Stateful() = default;
    virtual std::shared_ptr<const void> checkpoint() const = 0;
    virtual void restore(const std::shared_ptr<const void>& snapshot) = 0;
};

// Keeps all mutable state in one copyable struct
template <typename State>
class StatefulBase : public Stateful {
public:
    std::shared_ptr<const void> checkpoint() const override {
        return std::make_shared<const State>(state_);
    }

    void restore(const std::shared_ptr<const void>& snapshot) override {
        state_ = *std::static_pointer_cast<const State>(snapshot);
    }

protected:
    State state_;
};

// =============================================================================
// Runtime - execution substrate (clock, atomic calls, event delivery)
//
// Calls are single-threaded and run to completion. The outermost atomic()
// checkpoints every registered component; any exception restores them all
// and drops the events buffered by the call. Nested atomic() calls join
// the outer one.
// =============================================================================

class Runtime {
public:
    using Clock = std::function<uint64_t()>;

    Runtime();
    ~Runtime() = default;

    // Non-copyable
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Seconds; defaults to the system clock
    uint64_t now() const;
    void set_clock(Clock clock);

    void register_state(Stateful* component);
    void unregister_state(Stateful* component);

    void set_event_listener(EventListener* listener);
    void emit(Event event);

    bool in_call() const { return depth_ > 0; }

    template <typename Fn>
    auto atomic(const char* call, Fn&& fn) -> decltype(fn()) {
        using Result = decltype(fn());

        if (depth_ > 0) {
            DepthGuard guard(depth_);
            return fn();
        }

        Checkpoint saved = checkpoint_all();
        try {
            DepthGuard guard(depth_);
            if constexpr (std::is_void_v<Result>) {
                fn();
                commit(call);
            } else {
                Result result = fn();
                commit(call);
                return result;
            }
        } catch (const Error& e) {
            rollback(saved);
            notify_revert(call, e.code(), e.what());
            throw;
        } catch (...) {
            rollback(saved);
            throw;
        }
    }

private:
    using Checkpoint = std::vector<std::pair<Stateful*, std::shared_ptr<const void>>>;

    struct DepthGuard {
        explicit DepthGuard(int& depth) : depth_(depth) { ++depth_; }
        ~DepthGuard() { --depth_; }
        int& depth_;
    };

    Checkpoint checkpoint_all() const;
    void rollback(const Checkpoint& saved);
    void commit(const char* call);
    void notify_revert(const char* call, int32_t code, const char* detail);

    Clock clock_;
    std::vector<Stateful*> participants_;
    std::vector<Event> pending_;
    EventListener* listener_{nullptr};
    int depth_{0};
};

} // namespace isolend

#endif // ISOLEND_RUNTIME_HPP
