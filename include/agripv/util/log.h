#pragma once

#include <string>
#include <string_view>

namespace agripv::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Accepts "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
// Returns false and leaves *out untouched on unknown input.
bool parse_level(std::string_view s, Level* out);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace agripv::log
