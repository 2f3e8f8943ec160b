#ifndef ISOLEND_EVENTS_HPP
#define ISOLEND_EVENTS_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "types.hpp"

namespace isolend {

// =============================================================================
// Event (emitted by components, delivered when the outermost call commits)
// =============================================================================

struct Event {
    std::string name;
    Address emitter{};
    uint64_t timestamp = 0;
    std::vector<std::pair<std::string, std::string>> fields;

    Event() = default;
    Event(std::string n, const Address& from) : name(std::move(n)), emitter(from) {}

    Event& with(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }
    Event& with(std::string key, const char* value) {
        return with(std::move(key), std::string(value));
    }
    Event& with(std::string key, const Address& value) {
        return with(std::move(key), addresses::to_hex(value));
    }
    Event& with(std::string key, I128 value) {
        return with(std::move(key), to_string(value));
    }
    Event& with(std::string key, uint64_t value) {
        return with(std::move(key), std::to_string(value));
    }
    Event& with(std::string key, bool value) {
        return with(std::move(key), std::string(value ? "true" : "false"));
    }

    // Value of a field, empty when absent
    std::string field(std::string_view key) const {
        for (const auto& [k, v] : fields) {
            if (k == key) return v;
        }
        return {};
    }
};

// Callback interface for protocol notifications
class EventListener {
public:
    virtual ~EventListener() = default;
    virtual void on_event(const Event& event) = 0;
    virtual void on_revert(std::string_view call, int32_t code, std::string_view detail) {}
    virtual void on_commit(std::string_view call, size_t events) {}
};

// No-op listener for when notifications aren't needed
class NullEventListener : public EventListener {
public:
    void on_event(const Event&) override {}
};

// =============================================================================
// StreamLogger - one JSON object per line
// =============================================================================

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Off = 3
};

// "debug" | "info" | "warn" | "off"; throws Error(INVALID_PARAMETER) otherwise
LogLevel parse_log_level(std::string_view level);

class StreamLogger : public EventListener {
public:
    explicit StreamLogger(std::ostream& out, LogLevel level = LogLevel::Info);

    void on_event(const Event& event) override;
    void on_revert(std::string_view call, int32_t code, std::string_view detail) override;
    void on_commit(std::string_view call, size_t events) override;

    LogLevel level() const { return level_; }
    void set_level(LogLevel level) { level_ = level; }

private:
    std::ostream& out_;
    LogLevel level_;
};

} // namespace isolend

#endif // ISOLEND_EVENTS_HPP
