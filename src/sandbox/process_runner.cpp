#include "sandbox/process_runner.hpp"

#include <boost/process.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace execbox::sandbox {
namespace bp = boost::process;
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);
constexpr auto kGracePeriod = std::chrono::seconds(2);

// Capture files live under the system temp directory, never inside the
// workspace the program can see. Removed on every exit path.
struct CaptureFiles {
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;

    CaptureFiles() {
        const auto stamp = utils::RandomHex(16);
        const auto dir = std::filesystem::temp_directory_path();
        stdout_path = dir / ("execbox_stdout_" + stamp + ".log");
        stderr_path = dir / ("execbox_stderr_" + stamp + ".log");
    }
    ~CaptureFiles() {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
    }
    CaptureFiles(const CaptureFiles&) = delete;
    CaptureFiles& operator=(const CaptureFiles&) = delete;
};

// Returns true once the child has been reaped into `status`.
bool PollExit(pid_t pid, int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited == 0) {
            return false;
        }
        if (errno != EINTR) {
            throw ProcessError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
}

bool WaitUntil(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline) {
    while (std::chrono::steady_clock::now() < deadline) {
        if (PollExit(pid, status)) {
            return true;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    return PollExit(pid, status);
}

void Terminate(pid_t pid, int& status) {
    ::kill(pid, SIGTERM);
    if (WaitUntil(pid, status, std::chrono::steady_clock::now() + kGracePeriod)) {
        return;
    }
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

boost::filesystem::path ResolveInterpreter(const std::string& interpreter) {
    if (interpreter.find('/') != std::string::npos) {
        return boost::filesystem::path(interpreter);
    }
    auto resolved = bp::search_path(interpreter);
    if (resolved.empty()) {
        throw ProcessError("interpreter not found on PATH: " + interpreter);
    }
    return resolved;
}

}  // namespace

ProcessRunner::ProcessRunner(std::string interpreter)
    : interpreter_(std::move(interpreter)) {}

std::string ProcessRunner::TimeoutMessage(std::chrono::seconds timeout) {
    return "Execution timed out after " + std::to_string(timeout.count()) + " seconds";
}

RunResult ProcessRunner::Run(const std::filesystem::path& script,
                             const std::filesystem::path& working_dir,
                             std::chrono::seconds timeout) const {
    const auto interpreter = ResolveInterpreter(interpreter_);
    const CaptureFiles capture;

    bp::environment env = boost::this_process::environment();
    env["MPLCONFIGDIR"] = working_dir.string();

    RunResult result{};
    int status = 0;
    bool finished = false;
    const auto started = std::chrono::steady_clock::now();
    try {
        bp::child child_process(
            interpreter,
            script.string(),
            env,
            bp::start_dir = working_dir.string(),
            bp::std_in < bp::null,
            bp::std_out > capture.stdout_path.string(),
            bp::std_err > capture.stderr_path.string());

        const pid_t pid = child_process.id();
        finished = WaitUntil(pid, status, started + timeout);
        if (!finished) {
            Terminate(pid, status);
        }
        child_process.detach();
    } catch (const bp::process_error& ex) {
        throw ProcessError(std::string("exec failed: ") + ex.what());
    }

    if (!finished) {
        utils::Log(utils::LogLevel::kInfo, "exec", "timed out",
                   {{"timeout_s", std::to_string(timeout.count())}});
        result.timed_out = true;
        result.stderr_text = TimeoutMessage(timeout);
        result.exit_code = kFailureReturnCode;
        result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
        return result;
    }

    result.elapsed_ms = utils::ElapsedMs(started);
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    result.stdout_text = ReadCapture(capture.stdout_path);
    result.stderr_text = ReadCapture(capture.stderr_path);
    return result;
}

}  // namespace execbox::sandbox
