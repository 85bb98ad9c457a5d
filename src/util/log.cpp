#include <kiln/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace kiln::log {

static std::atomic<int> s_level{Info};
static std::once_flag s_color_once;
static std::atomic<bool> s_color_enabled{false};
static std::atomic<bool> s_color_forced{false};
static std::mutex s_write_mutex;
static thread_local const char* t_phase = nullptr;

static void init_color() {
    std::call_once(s_color_once, [] {
        if (!s_color_forced.load()) {
            s_color_enabled = isatty(fileno(stderr)) != 0;
        }
    });
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return static_cast<Level>(s_level.load());
}

bool parse_level(const std::string& name, Level& out) {
    if (name == "trace") { out = Trace; return true; }
    if (name == "debug") { out = Debug; return true; }
    if (name == "info")  { out = Info;  return true; }
    if (name == "warn")  { out = Warn;  return true; }
    if (name == "error") { out = Error; return true; }
    if (name == "off")   { out = Off;   return true; }
    return false;
}

void set_color_enabled(bool enabled) {
    s_color_forced = true;
    s_color_enabled = enabled;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
        case Off:   return "off";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
        case Off:   return "";
    }
    return "";
}

static const char* reset_color() {
    return "\033[0m";
}

ScopedPhase::ScopedPhase(const char* phase) : previous_(t_phase) {
    t_phase = phase;
}

ScopedPhase::~ScopedPhase() {
    t_phase = previous_;
}

const char* current_phase() {
    return t_phase;
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load() || lvl == Off) return;
    init_color();

    // Format first so concurrent builds never interleave within a line
    char stack_buf[1024];
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, copy);
    va_end(copy);

    std::string body;
    if (n < 0) {
        body = fmt;
    } else if (static_cast<size_t>(n) < sizeof(stack_buf)) {
        body.assign(stack_buf, static_cast<size_t>(n));
    } else {
        body.resize(static_cast<size_t>(n) + 1);
        std::vsnprintf(&body[0], body.size(), fmt, args);
        body.resize(static_cast<size_t>(n));
    }

    std::lock_guard<std::mutex> lock(s_write_mutex);
    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s%s: ", level_color(lvl), level_name(lvl), reset_color());
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }
    if (t_phase) {
        std::fprintf(stderr, "[%s] ", t_phase);
    }
    std::fprintf(stderr, "%s\n", body.c_str());
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace kiln::log
