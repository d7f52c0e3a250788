#include "server/http_server.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

#include "httplib.h"
#include "sandbox/errors.hpp"
#include "utils/logging.hpp"

namespace execbox::server {
namespace {

constexpr const char* kMissingCode = "Missing \"code\" field";
constexpr const char* kBadTimeout = "\"timeout\" must be an integer";

// Program output is not guaranteed to be UTF-8.
std::string Dump(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Reply(httplib::Response& res, const ApiResponse& api) {
    res.status = api.status;
    res.set_content(Dump(api.body), "application/json");
}

}  // namespace

sandbox::ExecutionRequest ParseExecuteRequest(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw sandbox::ValidationError(kMissingCode);
    }
    const auto code = json.find("code");
    if (code == json.end() || !code->is_string() || code->get_ref<const std::string&>().empty()) {
        throw sandbox::ValidationError(kMissingCode);
    }

    sandbox::ExecutionRequest request{};
    request.code = code->get<std::string>();

    const auto timeout = json.find("timeout");
    if (timeout != json.end() && !timeout->is_null()) {
        if (!timeout->is_number_integer()) {
            throw sandbox::ValidationError(kBadTimeout);
        }
        if (timeout->is_number_unsigned()) {
            const auto value = timeout->get<std::uint64_t>();
            request.timeout_seconds = value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                ? std::numeric_limits<int>::max()
                : static_cast<int>(value);
        } else {
            const auto value = timeout->get<std::int64_t>();
            request.timeout_seconds = value < std::numeric_limits<int>::min()
                ? std::numeric_limits<int>::min()
                : static_cast<int>(std::min<std::int64_t>(value, std::numeric_limits<int>::max()));
        }
    }
    return request;
}

nlohmann::json ResultToJson(const sandbox::ExecutionResult& result) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : result.files) {
        files.push_back({
            {"name", file.name},
            {"base64", file.base64},
            {"mimeType", file.mime_type}
        });
    }
    return {
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"returnCode", result.return_code},
        {"files", files},
        {"executionTimeMs", result.execution_time_ms}
    };
}

HttpServer::HttpServer(config::ServerConfig config, const sandbox::ExecutionCoordinator& coordinator)
    : config_(std::move(config))
    , coordinator_(coordinator)
    , server_(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

HttpServer::~HttpServer() {
    Stop();
}

ApiResponse HttpServer::HandleHealth() const {
    return ApiResponse{200, {{"status", "ok"}}};
}

ApiResponse HttpServer::HandleExecute(const std::string& body) const {
    sandbox::ExecutionRequest request;
    try {
        request = ParseExecuteRequest(body);
    } catch (const sandbox::ValidationError& ex) {
        return ApiResponse{400, {{"error", ex.what()}}};
    }

    try {
        const auto outcome = coordinator_.Execute(request);
        return ApiResponse{outcome.InternalError() ? 500 : 200, ResultToJson(outcome.result)};
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "server", "execute failed", {{"error", ex.what()}});
        sandbox::ExecutionResult failure{};
        failure.stderr_text = ex.what();
        return ApiResponse{500, ResultToJson(failure)};
    }
}

void HttpServer::RegisterRoutes() {
    const auto workers = static_cast<std::size_t>(config_.workers > 0 ? config_.workers : 1);
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::Log(utils::LogLevel::kInfo, "server", "request",
                   {{"method", req.method}, {"path", req.path}, {"status", std::to_string(res.status)}});
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        Reply(res, HandleHealth());
    });

    server_->Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        Reply(res, HandleExecute(req.body));
    });
}

bool HttpServer::Listen() {
    utils::Log(utils::LogLevel::kInfo, "server", "listening",
               {{"host", config_.host}, {"port", std::to_string(config_.port)},
                {"workers", std::to_string(config_.workers)}});
    return server_->listen(config_.host, config_.port);
}

int HttpServer::BindToAnyPort() {
    return server_->bind_to_any_port(config_.host);
}

bool HttpServer::ListenAfterBind() {
    return server_->listen_after_bind();
}

void HttpServer::Stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

bool HttpServer::IsRunning() const {
    return server_ && server_->is_running();
}

}  // namespace execbox::server
