#include "config/config_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace execbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyString(std::string& target, const nlohmann::json& section, const char* key) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& section, const char* key) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ApplyInt(config.execution.default_timeout_s, execution, "defaultTimeoutS");
        ApplyInt(config.execution.max_timeout_s, execution, "maxTimeoutS");
        ApplyString(config.execution.scratch_root, execution, "scratchRoot");
        ApplyString(config.execution.python, execution, "python");
        ApplyInt(config.execution.figure_dpi, execution, "figureDpi");
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ApplyString(config.server.host, server, "host");
        ApplyInt(config.server.port, server, "port");
        ApplyInt(config.server.workers, server, "workers");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

void ApplyEnvString(std::string& target, const char* name) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = value;
    }
}

void ApplyEnvInt(int& target, const char* name) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = GetEnv("EXECBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".execbox" / "config.json";
}

void NormalizeLimits(ExecutionConfig& execution) {
    execution.max_timeout_s = std::max(1, execution.max_timeout_s);
    execution.default_timeout_s = std::clamp(execution.default_timeout_s, 1, execution.max_timeout_s);
    if (execution.figure_dpi <= 0) {
        execution.figure_dpi = ExecutionConfig{}.figure_dpi;
    }
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::Log(utils::LogLevel::kWarn, "config", "ignoring malformed config file",
                       {{"path", config_path.string()}});
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvInt(config.execution.default_timeout_s, "EXECBOX_EXECUTION__DEFAULT_TIMEOUT_S");
    ApplyEnvInt(config.execution.max_timeout_s, "EXECBOX_EXECUTION__MAX_TIMEOUT_S");
    ApplyEnvString(config.execution.scratch_root, "EXECBOX_EXECUTION__SCRATCH_ROOT");
    ApplyEnvString(config.execution.python, "EXECBOX_EXECUTION__PYTHON");
    ApplyEnvInt(config.execution.figure_dpi, "EXECBOX_EXECUTION__FIGURE_DPI");
    ApplyEnvString(config.server.host, "EXECBOX_SERVER__HOST");
    ApplyEnvInt(config.server.port, "EXECBOX_SERVER__PORT");
    ApplyEnvInt(config.server.workers, "EXECBOX_SERVER__WORKERS");
    ApplyEnvString(config.logging.level, "EXECBOX_LOG_LEVEL");

    NormalizeLimits(config.execution);
    if (config.server.workers <= 0) {
        config.server.workers = ServerConfig{}.workers;
    }
    return config;
}

}  // namespace execbox::config
