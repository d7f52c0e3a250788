#include "sandbox/execution_coordinator.hpp"

#include <algorithm>

#include "config/config_loader.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace execbox::sandbox {
namespace {

ExecutionResult FailureResult(const std::string& message) {
    ExecutionResult result{};
    result.stderr_text = message;
    result.return_code = kFailureReturnCode;
    result.execution_time_ms = 0;
    return result;
}

config::ExecutionConfig Normalized(config::ExecutionConfig config) {
    config::NormalizeLimits(config);
    return config;
}

void Transition(ExecutionState& state, ExecutionState next, const std::string& id) {
    utils::Log(utils::LogLevel::kDebug, "exec", "state",
               {{"id", id.empty() ? "-" : id}, {"from", ToString(state)}, {"to", ToString(next)}});
    state = next;
}

}  // namespace

const char* ToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::kReceived: return "received";
        case ExecutionState::kWorkspaceReady: return "workspace_ready";
        case ExecutionState::kCodeStaged: return "code_staged";
        case ExecutionState::kRunning: return "running";
        case ExecutionState::kCompleted: return "completed";
        case ExecutionState::kTimedOut: return "timed_out";
        case ExecutionState::kFailed: return "failed";
        case ExecutionState::kCleanedUp: return "cleaned_up";
    }
    return "unknown";
}

std::chrono::seconds EffectiveTimeout(std::optional<int> requested,
                                      const config::ExecutionConfig& limits) {
    const int max_timeout = std::max(1, limits.max_timeout_s);
    int timeout = limits.default_timeout_s;
    if (requested.has_value() && *requested > 0) {
        timeout = *requested;
    }
    return std::chrono::seconds(std::clamp(timeout, 1, max_timeout));
}

ExecutionCoordinator::ExecutionCoordinator(config::ExecutionConfig config)
    : config_(Normalized(std::move(config)))
    , workspaces_(config_.scratch_root)
    , materializer_(config_.figure_dpi)
    , runner_(config_.python) {}

ExecutionOutcome ExecutionCoordinator::Execute(const ExecutionRequest& request) const {
    const auto timeout = EffectiveTimeout(request.timeout_seconds, config_);
    ExecutionState state = ExecutionState::kReceived;
    ExecutionOutcome outcome{};
    std::string id;

    WorkspaceLease lease(workspaces_);
    try {
        const auto& workspace = lease.Acquire();
        id = workspace.id;
        Transition(state, ExecutionState::kWorkspaceReady, id);

        const auto script = materializer_.Materialize(workspace, request.code);
        Transition(state, ExecutionState::kCodeStaged, id);

        Transition(state, ExecutionState::kRunning, id);
        auto run = runner_.Run(script, workspace.path, timeout);

        outcome.result.stdout_text = std::move(run.stdout_text);
        outcome.result.stderr_text = std::move(run.stderr_text);
        outcome.result.return_code = run.exit_code;
        outcome.result.execution_time_ms = run.elapsed_ms;
        if (run.timed_out) {
            Transition(state, ExecutionState::kTimedOut, id);
        } else {
            outcome.result.files = collector_.Collect(workspace);
            Transition(state, ExecutionState::kCompleted, id);
        }
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "exec", "execution failed",
                   {{"id", id.empty() ? "-" : id}, {"state", ToString(state)}, {"error", ex.what()}});
        outcome.result = FailureResult(ex.what());
        Transition(state, ExecutionState::kFailed, id);
    }
    outcome.state = state;

    lease.Release();
    Transition(state, ExecutionState::kCleanedUp, id);

    utils::Log(utils::LogLevel::kInfo, "exec", "finished",
               {{"id", id.empty() ? "-" : id},
                {"outcome", ToString(outcome.state)},
                {"return_code", std::to_string(outcome.result.return_code)},
                {"files", std::to_string(outcome.result.files.size())},
                {"elapsed_ms", std::to_string(outcome.result.execution_time_ms)}});
    return outcome;
}

}  // namespace execbox::sandbox
