#pragma once

#include <cstdio>
#include <optional>
#include <string>

namespace mxpack::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn"/"warning", "error" (any case)
std::optional<Level> parse_level(const std::string& name);

// Destination of log lines; stderr unless redirected. Passing nullptr
// restores stderr.
void set_sink(std::FILE* sink);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace mxpack::log
