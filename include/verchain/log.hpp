#pragma once

#include <verchain/result.hpp>
#include <string>
#include <cstdio>

namespace verchain::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Log lines go to stderr unless redirected; nullptr restores stderr.
// Redirecting re-detects color on the new stream unless it was set explicitly.
void set_output(std::FILE* out);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parses "trace" .. "error" (any case)
Result<Level> parse_level(const std::string& name);

} // namespace verchain::log
