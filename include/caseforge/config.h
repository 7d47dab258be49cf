#pragma once

#include <functional>
#include <optional>
#include <string_view>

namespace caseforge {

enum class LogLevel {
    Off,
    Error,
    Warn,
    Info,
    Debug,
};

struct Config {
    LogLevel log_level = LogLevel::Warn;
};

// Accepts off|error|warn|info|debug, case-insensitive.
std::optional<LogLevel> parse_log_level(std::string_view text);
std::string_view        to_string(LogLevel level);

// Defaults overridden by CASEFORGE_LOG when it holds a valid level.
Config config_from_env();

void     apply_config(const Config &config);
void     set_log_level(LogLevel level);
LogLevel log_level();

// Receives each formatted log line (without trailing newline). An empty
// function restores the default stderr sink.
using LogSink = std::function<void(std::string_view line)>;
void set_log_sink(LogSink sink);

} // namespace caseforge
