#include "caseforge/config.h"

#include "log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <fmt/core.h>
#include <mutex>
#include <string>
#include <utility>

namespace caseforge {

namespace {

std::atomic<LogLevel> &level_storage() {
    static std::atomic<LogLevel> level{config_from_env().log_level};
    return level;
}

std::mutex &sink_mutex() {
    static std::mutex mu;
    return mu;
}

LogSink &sink_storage() {
    static LogSink sink;
    return sink;
}

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "off" || lowered == "none")
        return LogLevel::Off;
    if (lowered == "error")
        return LogLevel::Error;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::Warn;
    if (lowered == "info")
        return LogLevel::Info;
    if (lowered == "debug")
        return LogLevel::Debug;
    return std::nullopt;
}

std::string_view to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Off: return "off";
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
    }
    return "warn";
}

Config config_from_env() {
    Config cfg{};
    if (const char *value = std::getenv("CASEFORGE_LOG"); value != nullptr && *value != '\0') {
        if (auto level = parse_log_level(value)) {
            cfg.log_level = *level;
        } else {
            fmt::print(stderr, "caseforge: ignoring unknown CASEFORGE_LOG value '{}'\n", value);
        }
    }
    return cfg;
}

void apply_config(const Config &config) { set_log_level(config.log_level); }

void set_log_level(LogLevel level) { level_storage().store(level, std::memory_order_relaxed); }

LogLevel log_level() { return level_storage().load(std::memory_order_relaxed); }

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink_storage() = std::move(sink);
}

namespace detail {

bool log_enabled(LogLevel level) {
    const LogLevel current = log_level();
    return level != LogLevel::Off && current != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(current);
}

void write_log_line(LogLevel level, std::string_view message) {
    const std::string line = fmt::format("caseforge: {}: {}", to_string(level), message);
    LogSink           sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        sink = sink_storage();
    }
    // Called unlocked so a sink may log or replace itself.
    if (sink) {
        sink(line);
        return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex());
    fmt::print(stderr, "{}\n", line);
}

} // namespace detail

} // namespace caseforge
