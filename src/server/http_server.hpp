#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/execution_coordinator.hpp"

namespace httplib {
class Server;
}

namespace execbox::server {

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// Throws sandbox::ValidationError for a missing/empty "code" or a
// non-integer "timeout".
sandbox::ExecutionRequest ParseExecuteRequest(const std::string& body);

nlohmann::json ResultToJson(const sandbox::ExecutionResult& result);

class HttpServer {
public:
    HttpServer(config::ServerConfig config, const sandbox::ExecutionCoordinator& coordinator);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    ApiResponse HandleHealth() const;
    ApiResponse HandleExecute(const std::string& body) const;

    // Blocks until Stop() is called. Returns false if the socket cannot be bound.
    bool Listen();
    // Binds an ephemeral port on host and returns it, or -1 on failure.
    int BindToAnyPort();
    // Serves on a socket bound by BindToAnyPort().
    bool ListenAfterBind();
    void Stop();
    bool IsRunning() const;

private:
    config::ServerConfig config_;
    const sandbox::ExecutionCoordinator& coordinator_;
    std::unique_ptr<httplib::Server> server_;

    void RegisterRoutes();
};

}  // namespace execbox::server
