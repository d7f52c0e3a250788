#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace execbox::sandbox {

// Exit code reported for timeouts and orchestration failures.
constexpr int kFailureReturnCode = -1;

struct RunResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = kFailureReturnCode;
    long long elapsed_ms = 0;
    bool timed_out = false;
};

class ProcessRunner {
public:
    explicit ProcessRunner(std::string interpreter = "python3");

    // Runs `interpreter script` in working_dir with MPLCONFIGDIR pointed at
    // working_dir. On timeout the child is killed and a synthetic result with
    // elapsed_ms == timeout is returned. Throws ProcessError if the
    // interpreter cannot be spawned.
    RunResult Run(const std::filesystem::path& script,
                  const std::filesystem::path& working_dir,
                  std::chrono::seconds timeout) const;

    static std::string TimeoutMessage(std::chrono::seconds timeout);

private:
    std::string interpreter_;
};

}  // namespace execbox::sandbox
