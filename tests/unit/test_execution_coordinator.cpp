#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <fstream>
#include <future>
#include <vector>

#include "sandbox/execution_coordinator.hpp"
#include "unit/test_support.hpp"

using namespace execbox::sandbox;
using Catch::Matchers::ContainsSubstring;
using execbox::test::HasMatplotlib;
using execbox::test::ScratchDir;
using execbox::test::TestExecutionConfig;

namespace {

std::size_t WorkspaceCount(const execbox::config::ExecutionConfig& config) {
    if (!std::filesystem::exists(config.scratch_root)) {
        return 0;
    }
    std::size_t count = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(config.scratch_root)) {
        ++count;
    }
    return count;
}

ExecutionRequest Request(std::string code, std::optional<int> timeout = std::nullopt) {
    return ExecutionRequest{std::move(code), timeout};
}

}  // namespace

TEST_CASE("Effective timeout is clamped to the configured maximum", "[coordinator]") {
    execbox::config::ExecutionConfig limits{};
    limits.default_timeout_s = 30;
    limits.max_timeout_s = 60;

    REQUIRE(EffectiveTimeout(std::nullopt, limits) == std::chrono::seconds(30));
    REQUIRE(EffectiveTimeout(5, limits) == std::chrono::seconds(5));
    REQUIRE(EffectiveTimeout(60, limits) == std::chrono::seconds(60));
    REQUIRE(EffectiveTimeout(600, limits) == std::chrono::seconds(60));
    REQUIRE(EffectiveTimeout(0, limits) == std::chrono::seconds(30));
    REQUIRE(EffectiveTimeout(-4, limits) == std::chrono::seconds(30));

    limits.default_timeout_s = 90;
    REQUIRE(EffectiveTimeout(std::nullopt, limits) == std::chrono::seconds(60));
}

TEST_CASE("Hello world completes with plain output", "[coordinator]") {
    ScratchDir scratch;
    const auto config = TestExecutionConfig(scratch.Path());
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request("print(\"hello\")"));

    REQUIRE(outcome.state == ExecutionState::kCompleted);
    REQUIRE_FALSE(outcome.InternalError());
    REQUIRE(outcome.result.stdout_text == "hello\n");
    REQUIRE(outcome.result.stderr_text.empty());
    REQUIRE(outcome.result.return_code == 0);
    REQUIRE(outcome.result.files.empty());
    REQUIRE(outcome.result.execution_time_ms >= 0);
    REQUIRE(WorkspaceCount(config) == 0);
}

TEST_CASE("Timed out programs produce the synthetic result", "[coordinator]") {
    ScratchDir scratch;
    const auto config = TestExecutionConfig(scratch.Path());
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request("import time\ntime.sleep(30)\n", 1));

    REQUIRE(outcome.state == ExecutionState::kTimedOut);
    REQUIRE_FALSE(outcome.InternalError());
    REQUIRE(outcome.result.return_code == kFailureReturnCode);
    REQUIRE(outcome.result.stdout_text.empty());
    REQUIRE_THAT(outcome.result.stderr_text, ContainsSubstring("1"));
    REQUIRE(outcome.result.stderr_text == "Execution timed out after 1 seconds");
    REQUIRE(outcome.result.execution_time_ms == 1000);
    REQUIRE(outcome.result.files.empty());
    REQUIRE(WorkspaceCount(config) == 0);
}

TEST_CASE("Requested timeouts above the maximum are clamped, not rejected", "[coordinator]") {
    ScratchDir scratch;
    auto config = TestExecutionConfig(scratch.Path());
    config.max_timeout_s = 1;
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request("import time\ntime.sleep(30)\n", 500));

    REQUIRE(outcome.state == ExecutionState::kTimedOut);
    REQUIRE(outcome.result.execution_time_ms == 1000);
    REQUIRE_THAT(outcome.result.stderr_text, ContainsSubstring("after 1 seconds"));
}

TEST_CASE("Unhandled exceptions are runtime failures, not internal errors", "[coordinator]") {
    ScratchDir scratch;
    const auto config = TestExecutionConfig(scratch.Path());
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request("raise ValueError('bad input value')"));

    REQUIRE(outcome.state == ExecutionState::kCompleted);
    REQUIRE_FALSE(outcome.InternalError());
    REQUIRE(outcome.result.return_code != 0);
    REQUIRE_THAT(outcome.result.stderr_text, ContainsSubstring("ValueError: bad input value"));
    REQUIRE(WorkspaceCount(config) == 0);
}

TEST_CASE("Files written by the program do not outlive the request", "[coordinator]") {
    ScratchDir scratch;
    const auto config = TestExecutionConfig(scratch.Path());
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request(
        "import os\n"
        "os.makedirs('out/deep', exist_ok=True)\n"
        "open('out/deep/data.txt', 'w').write('x')\n"
        "open('chart.png', 'wb').write(b'not really a png')\n"
        "print(os.getcwd())\n"));

    REQUIRE(outcome.state == ExecutionState::kCompleted);
    REQUIRE(outcome.result.files.size() == 1);
    REQUIRE(outcome.result.files[0].name == "chart.png");
    REQUIRE(WorkspaceCount(config) == 0);
    REQUIRE_FALSE(std::filesystem::exists(outcome.result.stdout_text.substr(0, outcome.result.stdout_text.size() - 1)));
}

TEST_CASE("Unusable scratch root yields an internal error", "[coordinator]") {
    ScratchDir scratch;
    auto config = TestExecutionConfig(scratch.Path());
    const auto blocker = scratch.Path() / "blocker";
    std::ofstream(blocker) << "file";
    config.scratch_root = (blocker / "workspaces").string();
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request("print(1)"));

    REQUIRE(outcome.state == ExecutionState::kFailed);
    REQUIRE(outcome.InternalError());
    REQUIRE(outcome.result.stdout_text.empty());
    REQUIRE_FALSE(outcome.result.stderr_text.empty());
    REQUIRE(outcome.result.return_code == kFailureReturnCode);
    REQUIRE(outcome.result.execution_time_ms == 0);
    REQUIRE(outcome.result.files.empty());
}

TEST_CASE("Staging failure yields an internal error and still cleans up", "[coordinator]") {
    ScratchDir scratch;
    auto config = TestExecutionConfig(scratch.Path());
    // A root that is not valid UTF-8 can be created but not quoted into the script.
    config.scratch_root = (scratch.Path() / "bad\xff").string();
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request("print(1)"));

    REQUIRE(outcome.state == ExecutionState::kFailed);
    REQUIRE(outcome.InternalError());
    REQUIRE(outcome.result.stdout_text.empty());
    REQUIRE_THAT(outcome.result.stderr_text, ContainsSubstring("UTF-8"));
    REQUIRE(outcome.result.return_code == kFailureReturnCode);
    REQUIRE(outcome.result.execution_time_ms == 0);
    REQUIRE(outcome.result.files.empty());
    REQUIRE(std::filesystem::is_directory(config.scratch_root));
    REQUIRE(WorkspaceCount(config) == 0);
}

TEST_CASE("Output survives a program that empties its working directory", "[coordinator]") {
    ScratchDir scratch;
    const auto config = TestExecutionConfig(scratch.Path());
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request(
        "import os\n"
        "for name in os.listdir('.'):\n"
        "    os.remove(name)\n"
        "print('hello')\n"));

    REQUIRE(outcome.state == ExecutionState::kCompleted);
    REQUIRE(outcome.result.return_code == 0);
    REQUIRE(outcome.result.stdout_text == "hello\n");
    REQUIRE(WorkspaceCount(config) == 0);
}

TEST_CASE("Missing interpreter yields an internal error and still cleans up", "[coordinator]") {
    ScratchDir scratch;
    auto config = TestExecutionConfig(scratch.Path());
    config.python = "execbox-no-such-python";
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request("print(1)"));

    REQUIRE(outcome.state == ExecutionState::kFailed);
    REQUIRE_THAT(outcome.result.stderr_text, ContainsSubstring("execbox-no-such-python"));
    REQUIRE(outcome.result.execution_time_ms == 0);
    REQUIRE(WorkspaceCount(config) == 0);
}

TEST_CASE("Concurrent executions never see each other's files", "[coordinator]") {
    ScratchDir scratch;
    const auto config = TestExecutionConfig(scratch.Path());
    ExecutionCoordinator coordinator(config);

    const std::string code =
        "import os, time, uuid\n"
        "tag = uuid.uuid4().hex\n"
        "open(tag + '.png', 'w').write(tag)\n"
        "time.sleep(0.5)\n"
        "print(tag)\n"
        "print(sorted(os.listdir('.')))\n";

    std::vector<std::future<ExecutionOutcome>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(std::async(std::launch::async, [&coordinator, &code] {
            return coordinator.Execute(ExecutionRequest{code, std::nullopt});
        }));
    }

    for (auto& future : futures) {
        const auto outcome = future.get();
        REQUIRE(outcome.state == ExecutionState::kCompleted);
        const auto tag = outcome.result.stdout_text.substr(0, outcome.result.stdout_text.find('\n'));
        REQUIRE(outcome.result.files.size() == 1);
        REQUIRE(outcome.result.files[0].name == tag + ".png");
    }
    REQUIRE(WorkspaceCount(config) == 0);
}

TEST_CASE("Open figures are exported as numbered png files", "[coordinator][matplotlib]") {
    if (!HasMatplotlib()) {
        SKIP("matplotlib is not installed");
    }
    ScratchDir scratch;
    const auto config = TestExecutionConfig(scratch.Path());
    ExecutionCoordinator coordinator(config);

    const auto outcome = coordinator.Execute(Request(
        "import matplotlib.pyplot as plt\n"
        "plt.figure()\n"
        "plt.plot([1, 2, 3])\n"
        "plt.figure()\n"
        "plt.bar(['a', 'b'], [3, 4])\n"));

    REQUIRE(outcome.state == ExecutionState::kCompleted);
    REQUIRE(outcome.result.return_code == 0);
    REQUIRE(outcome.result.files.size() == 2);
    REQUIRE(outcome.result.files[0].name == "figure_0.png");
    REQUIRE(outcome.result.files[1].name == "figure_1.png");
    for (const auto& file : outcome.result.files) {
        REQUIRE(file.mime_type == "image/png");
        REQUIRE(file.base64.rfind("iVBORw0KGgo", 0) == 0);
        REQUIRE(file.base64.size() % 4 == 0);
    }
    REQUIRE(WorkspaceCount(config) == 0);
}
