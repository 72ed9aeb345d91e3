#pragma once

#include <string>
#include <string_view>

namespace tessera::core {

enum class LogLevel { Debug, Info, Warning, Error, Off };

// Process-wide threshold. Starts at Warning unless TESSERA_LOG_LEVEL names another level.
void set_log_level(LogLevel level);
LogLevel log_level();

bool parse_log_level(const std::string& value, LogLevel& out, std::string& error);
const char* log_level_name(LogLevel level);

// Writes one "[level] tag: message" line to std::cerr if level passes the threshold.
void log_message(LogLevel level, std::string_view tag, const std::string& message);

} // namespace tessera::core
