#include "log.h"

#include "text_parse.h"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace tessera::core {
namespace {

std::atomic<int>& level_storage() {
    static std::atomic<int> level = [] {
        LogLevel initial = LogLevel::Warning;
        if (const char* env = std::getenv("TESSERA_LOG_LEVEL"); env != nullptr && env[0] != '\0') {
            std::string error;
            LogLevel parsed = LogLevel::Warning;
            if (parse_log_level(env, parsed, error)) {
                initial = parsed;
            } else {
                std::cerr << "[warning] log: " << error << " in TESSERA_LOG_LEVEL\n";
            }
        }
        return static_cast<int>(initial);
    }();
    return level;
}

std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

void set_log_level(LogLevel level) {
    level_storage().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_storage().load(std::memory_order_relaxed));
}

bool parse_log_level(const std::string& value, LogLevel& out, std::string& error) {
    const std::string lower = to_lower_copy(trim_copy(value));
    if (lower == "debug") {
        out = LogLevel::Debug;
    } else if (lower == "info") {
        out = LogLevel::Info;
    } else if (lower == "warning" || lower == "warn") {
        out = LogLevel::Warning;
    } else if (lower == "error") {
        out = LogLevel::Error;
    } else if (lower == "off" || lower == "none") {
        out = LogLevel::Off;
    } else {
        error = "invalid log level '" + value + "'";
        return false;
    }
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void log_message(LogLevel level, std::string_view tag, const std::string& message) {
    if (level == LogLevel::Off || static_cast<int>(level) < static_cast<int>(log_level())) {
        return;
    }
    std::scoped_lock lock(output_mutex());
    std::cerr << '[' << log_level_name(level) << "] " << tag << ": " << message << '\n';
}

} // namespace tessera::core
