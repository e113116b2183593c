#pragma once

#include <functional>
#include <string>

namespace wharf::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Accepts "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
bool parse_level(const std::string& name, Level& out);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Receives each formatted line ("HH:MM:SS.mmm message") instead of stderr.
// Pass an empty function to restore the stderr sink.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace wharf::log
