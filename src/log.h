// Thread-safe logging for caseforge, formatted with fmt.
#pragma once

#include "caseforge/config.h"

#include <fmt/format.h>

#include <iterator>
#include <string_view>
#include <utility>

namespace caseforge::detail {

bool log_enabled(LogLevel level);
void write_log_line(LogLevel level, std::string_view message);

template <typename... Args> void log(LogLevel level, fmt::format_string<Args...> format_string, Args &&...args) {
    if (!log_enabled(level))
        return;
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    write_log_line(level, std::string_view(buffer.data(), buffer.size()));
}

template <typename... Args> void log_warn(fmt::format_string<Args...> format_string, Args &&...args) {
    log(LogLevel::Warn, format_string, std::forward<Args>(args)...);
}

template <typename... Args> void log_debug(fmt::format_string<Args...> format_string, Args &&...args) {
    log(LogLevel::Debug, format_string, std::forward<Args>(args)...);
}

} // namespace caseforge::detail
