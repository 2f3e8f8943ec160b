// =============================================================================
// events.cpp - JSON-lines event logger
// =============================================================================

#include "isolend/events.hpp"

#include <nlohmann/json.hpp>

namespace isolend {

LogLevel parse_log_level(std::string_view level) {
    if (level == "debug") return LogLevel::Debug;
    if (level == "info") return LogLevel::Info;
    if (level == "warn") return LogLevel::Warn;
    if (level == "off") return LogLevel::Off;
    throw Error(errors::INVALID_PARAMETER, "unknown log level: " + std::string(level));
}

StreamLogger::StreamLogger(std::ostream& out, LogLevel level)
    : out_(out), level_(level) {}

void StreamLogger::on_event(const Event& event) {
    if (level_ > LogLevel::Info) return;

    nlohmann::json line = {
        {"level", "info"},
        {"ts", event.timestamp},
        {"event", event.name},
        {"emitter", addresses::to_hex(event.emitter)}
    };
    for (const auto& [key, value] : event.fields) {
        line[key] = value;
    }
    out_ << line.dump() << "\n";
}

void StreamLogger::on_revert(std::string_view call, int32_t code, std::string_view detail) {
    if (level_ > LogLevel::Warn) return;

    nlohmann::json line = {
        {"level", "warn"},
        {"revert", std::string(call)},
        {"error", errors::name(code)},
        {"detail", std::string(detail)}
    };
    out_ << line.dump() << "\n";
}

void StreamLogger::on_commit(std::string_view call, size_t events) {
    if (level_ > LogLevel::Debug) return;

    nlohmann::json line = {
        {"level", "debug"},
        {"commit", std::string(call)},
        {"events", events}
    };
    out_ << line.dump() << "\n";
}

} // namespace isolend
