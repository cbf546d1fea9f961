#pragma once

#include <string>
#include <cstdio>

namespace uuid25::log {

enum Level { Trace, Debug, Info, Warn, Error };

// Process-wide settings; configure once before concurrent use.
void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Inverse of level_name(). Returns false for an unknown name.
bool parse_level_name(const std::string& name, Level& out);

} // namespace uuid25::log
