#pragma once

#include <locus/result.hpp>
#include <string>
#include <cstdio>

namespace locus::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// True if a message at `lvl` would be written
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace", "debug", "info", "warn"/"warning" or "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

// Apply LOCUS_LOG (a level name) if set. Returns false on an unknown name.
bool init_from_env();

} // namespace locus::log
