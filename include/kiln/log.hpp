#pragma once

#include <string>

namespace kiln::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn", "error" or "off"
bool parse_level(const std::string& name, Level& out);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Tags every message logged on this thread with "[phase] " while alive.
// Guards nest; the innermost phase wins.
class ScopedPhase {
public:
    explicit ScopedPhase(const char* phase);
    ~ScopedPhase();

    ScopedPhase(const ScopedPhase&) = delete;
    ScopedPhase& operator=(const ScopedPhase&) = delete;

private:
    const char* previous_;
};

// Phase active on the calling thread, or nullptr
const char* current_phase();

} // namespace kiln::log
