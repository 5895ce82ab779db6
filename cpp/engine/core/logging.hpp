#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Levelled diagnostics for parcel_sort front ends.
  - One line shape for every sink: [<UTC time>][<LEVEL>] <msg>

Policy:
  - The sorting engine never logs. Validation and classification stay
    silent and report through SortResult or parcel::Error.
  - log() writes WARN/ERROR to stderr and DEBUG/INFO to stdout.
  - The CLI owns stdout for the category, so it formats its trace with
    format_log_line() and writes it to its diagnostic stream instead.
  - Nothing here throws into the caller; a failed write is dropped.
===========================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace parcel {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// True when a message at lvl passes the current verbosity.
bool log_enabled(LogLevel lvl) noexcept;

const char* to_string(LogLevel lvl) noexcept;

// Accepts "debug", "info", "warn", "error" (lowercase only).
std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

// "[<UTC ISO-8601>][<LEVEL>] <msg>\n"
std::string format_log_line(LogLevel lvl, std::string_view msg);

void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace parcel
