#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace execbox::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_output_mutex;

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"' || c == '=';
    });
}

}  // namespace

LogLevel ParseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    return LogLevel::kInfo;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

LogConfig GetLogConfig() {
    return LogConfig{g_min_level.load()};
}

void Log(const LogMessage& message) {
    if (message.level < g_min_level.load()) {
        return;
    }
    std::ostringstream line;
    line << "[" << message.tag << "] " << ToString(message.level) << " " << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=";
        if (NeedsQuoting(value)) {
            line << "\"" << value << "\"";
        } else {
            line << value;
        }
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace execbox::utils
