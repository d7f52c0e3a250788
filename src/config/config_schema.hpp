#pragma once

#include <string>

namespace execbox::config {

struct ExecutionConfig {
    int default_timeout_s = 30;
    int max_timeout_s = 60;
    std::string scratch_root = "/tmp/sandbox";
    std::string python = "python3";
    int figure_dpi = 150;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int workers = 8;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ExecutionConfig execution;
    ServerConfig server;
    LoggingConfig logging;
};

}  // namespace execbox::config
