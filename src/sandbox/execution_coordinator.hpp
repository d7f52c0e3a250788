#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/artifact_collector.hpp"
#include "sandbox/code_materializer.hpp"
#include "sandbox/process_runner.hpp"
#include "sandbox/workspace_manager.hpp"

namespace execbox::sandbox {

struct ExecutionRequest {
    std::string code;
    std::optional<int> timeout_seconds;
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int return_code = kFailureReturnCode;
    std::vector<ArtifactFile> files;
    long long execution_time_ms = 0;
};

enum class ExecutionState {
    kReceived,
    kWorkspaceReady,
    kCodeStaged,
    kRunning,
    kCompleted,
    kTimedOut,
    kFailed,
    kCleanedUp
};

const char* ToString(ExecutionState state);

struct ExecutionOutcome {
    ExecutionResult result;
    // Completed, TimedOut or Failed; the state reached before cleanup.
    ExecutionState state = ExecutionState::kFailed;

    bool InternalError() const { return state == ExecutionState::kFailed; }
};

// min(requested or default, max); non-positive requests use the default.
std::chrono::seconds EffectiveTimeout(std::optional<int> requested,
                                      const config::ExecutionConfig& limits);

// Runs one request end to end. Holds no per-request state, so a single
// instance may serve concurrent callers.
class ExecutionCoordinator {
public:
    explicit ExecutionCoordinator(config::ExecutionConfig config);

    ExecutionOutcome Execute(const ExecutionRequest& request) const;

    const config::ExecutionConfig& Config() const { return config_; }

private:
    config::ExecutionConfig config_;
    WorkspaceManager workspaces_;
    CodeMaterializer materializer_;
    ProcessRunner runner_;
    ArtifactCollector collector_;
};

}  // namespace execbox::sandbox
