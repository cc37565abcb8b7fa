#include <phind/log.hpp>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace phind::log {

static Level s_level = Info;
static std::FILE* s_stream = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* out() {
    return s_stream ? s_stream : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(out()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_stream(std::FILE* stream) {
    s_stream = stream;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

std::optional<Level> parse_level(const std::string& name) {
    if (name == "trace") return Trace;
    if (name == "debug") return Debug;
    if (name == "info") return Info;
    if (name == "warn" || name == "warning") return Warn;
    if (name == "error") return Error;
    return std::nullopt;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    std::FILE* f = out();
    if (s_color_enabled) {
        std::fprintf(f, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(f, "%s: ", level_name(lvl));
    }

    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

#define PHIND_DEFINE_LOG_FN(fn, lvl)      \
    void fn(const char* fmt, ...) {       \
        va_list args;                     \
        va_start(args, fmt);              \
        log_message(lvl, fmt, args);      \
        va_end(args);                     \
    }

PHIND_DEFINE_LOG_FN(trace, Trace)
PHIND_DEFINE_LOG_FN(debug, Debug)
PHIND_DEFINE_LOG_FN(info, Info)
PHIND_DEFINE_LOG_FN(warn, Warn)
PHIND_DEFINE_LOG_FN(error, Error)

#undef PHIND_DEFINE_LOG_FN

} // namespace phind::log
