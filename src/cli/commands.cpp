#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "sandbox/execution_coordinator.hpp"
#include "server/http_server.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

execbox::config::Config LoadAndApplyConfig() {
    auto config = execbox::config::LoadConfig();
    execbox::utils::SetLogConfig(
        execbox::utils::LogConfig{execbox::utils::ParseLogLevel(config.logging.level)});
    return config;
}

int RunServer() {
    const auto config = LoadAndApplyConfig();
    execbox::sandbox::ExecutionCoordinator coordinator(config.execution);
    execbox::server::HttpServer http_server(config.server, coordinator);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::atomic<bool> listen_returned{false};
    std::thread http_thread([&http_server, &listen_failed, &listen_returned]() {
        if (!http_server.Listen()) {
            listen_failed.store(true);
        }
        listen_returned.store(true);
    });

    std::cout << "execbox listening on " << config.server.host << ":" << config.server.port
              << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // A signal may arrive before listen() has started accepting.
    while (!listen_returned.load()) {
        http_server.Stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (http_thread.joinable()) {
        http_thread.join();
    }
    if (listen_failed.load()) {
        execbox::utils::Log(execbox::utils::LogLevel::kError, "server", "failed to listen",
                            {{"host", config.server.host}, {"port", std::to_string(config.server.port)}});
        return 1;
    }
    return 0;
}

std::optional<int> ParseTimeoutArg(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int RunFile(const std::string& path, const std::optional<std::string>& timeout_arg) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        std::cerr << "Cannot read " << path << std::endl;
        return 1;
    }
    std::ostringstream code;
    code << input.rdbuf();

    execbox::sandbox::ExecutionRequest request{};
    request.code = code.str();
    if (timeout_arg) {
        request.timeout_seconds = ParseTimeoutArg(*timeout_arg);
        if (!request.timeout_seconds) {
            std::cerr << "Timeout must be an integer: " << *timeout_arg << std::endl;
            return 1;
        }
    }
    if (request.code.empty()) {
        std::cerr << "Program is empty: " << path << std::endl;
        return 1;
    }

    const auto config = LoadAndApplyConfig();
    execbox::sandbox::ExecutionCoordinator coordinator(config.execution);
    const auto outcome = coordinator.Execute(request);
    std::cout << execbox::server::ResultToJson(outcome.result).dump(
        2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return outcome.InternalError() ? 1 : 0;
}

void PrintUsage() {
    std::cout << "Usage: execbox serve | execbox run <file.py> [timeout_seconds]" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return RunServer();
    }

    if (argc >= 3 && std::string(argv[1]) == "run") {
        std::optional<std::string> timeout_arg;
        if (argc >= 4) {
            timeout_arg = argv[3];
        }
        return RunFile(argv[2], timeout_arg);
    }

    PrintUsage();
    return 1;
}
