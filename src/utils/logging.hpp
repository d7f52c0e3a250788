#pragma once

#include <string>
#include <utility>
#include <vector>

namespace execbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Unknown names map to kInfo.
LogLevel ParseLogLevel(const std::string& name);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] LEVEL message key=value ..." to stderr as one line.
void Log(const LogMessage& message);

inline void Log(LogLevel level,
                const std::string& tag,
                const std::string& message,
                LogFields fields = {}) {
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace execbox::utils
