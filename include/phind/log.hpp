#pragma once

#include <cstdio>
#include <optional>
#include <string>

#if defined(__GNUC__) || defined(__clang__)
#define PHIND_PRINTF_FORMAT(fmt_idx, args_idx) \
    __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define PHIND_PRINTF_FORMAT(fmt_idx, args_idx)
#endif

namespace phind::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination for log lines. Defaults to stderr; nullptr restores it.
void set_stream(std::FILE* stream);

void trace(const char* fmt, ...) PHIND_PRINTF_FORMAT(1, 2);
void debug(const char* fmt, ...) PHIND_PRINTF_FORMAT(1, 2);
void info(const char* fmt, ...) PHIND_PRINTF_FORMAT(1, 2);
void warn(const char* fmt, ...) PHIND_PRINTF_FORMAT(1, 2);
void error(const char* fmt, ...) PHIND_PRINTF_FORMAT(1, 2);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); accepts "warning" as an alias for "warn".
std::optional<Level> parse_level(const std::string& name);

} // namespace phind::log
