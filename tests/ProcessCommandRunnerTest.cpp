#include <catch2/catch_test_macros.hpp>
#include "workflow/CommandRunner.hpp"
#include "workflow/ExecutionContext.hpp"
#include "workflow/WorkflowEngine.hpp"
#include "workflow/WorkflowParser.hpp"
#include "TestSupport.hpp"
#include <chrono>
#include <optional>

using namespace sysflow::workflow;
using sysflow::testing::TempDirectory;

namespace {

CommandRequest shRequest(const std::string& command) {
    CommandRequest request;
    request.command = command;
    request.shell = "sh";
    request.environment = ExecutionContext::processEnvironment();
    return request;
}

} // namespace

// =============================================================================
// Interpreters
// =============================================================================

TEST_CASE("Interpreter resolution", "[ProcessCommandRunner]") {
    auto sh = ProcessCommandRunner::interpreterCommand("sh");
    REQUIRE(sh.size() == 2);
    REQUIRE(sh[1] == "-c");

    auto absolute = ProcessCommandRunner::interpreterCommand("/bin/sh");
    REQUIRE(absolute[0] == "/bin/sh");

    REQUIRE_THROWS_AS(ProcessCommandRunner::interpreterCommand("no-such-shell-xyz"), std::runtime_error);
    REQUIRE_THROWS_AS(ProcessCommandRunner::interpreterCommand("/nonexistent/bash"), std::runtime_error);
}

TEST_CASE("Inline code flag per interpreter", "[ProcessCommandRunner]") {
    REQUIRE(ProcessCommandRunner::inlineFlag("bash") == std::optional<std::string>("-c"));
    REQUIRE(ProcessCommandRunner::inlineFlag("/bin/sh") == std::optional<std::string>("-c"));
    REQUIRE(ProcessCommandRunner::inlineFlag("python") == std::optional<std::string>("-c"));
    REQUIRE(ProcessCommandRunner::inlineFlag("perl") == std::optional<std::string>("-e"));
    REQUIRE(ProcessCommandRunner::inlineFlag("/usr/bin/ruby") == std::optional<std::string>("-e"));
    REQUIRE(ProcessCommandRunner::inlineFlag("node") == std::optional<std::string>("-e"));
    REQUIRE_FALSE(ProcessCommandRunner::inlineFlag("awk"));
    REQUIRE_FALSE(ProcessCommandRunner::inlineFlag(""));
}

// =============================================================================
// Real subprocesses
// =============================================================================

TEST_CASE("Capture stdout and exit code", "[ProcessCommandRunner][Integration]") {
    ProcessCommandRunner runner;
    auto outcome = runner.run(shRequest("echo hello; echo oops >&2; exit 3"));

    REQUIRE(outcome.exitCode == 3);
    REQUIRE(outcome.stdOut == "hello\n");
    REQUIRE(outcome.stdErr == "oops\n");
    REQUIRE_FALSE(outcome.timedOut);
    REQUIRE_FALSE(outcome.success());
}

TEST_CASE("Environment and working directory reach the child", "[ProcessCommandRunner][Integration]") {
    TempDirectory dir;
    ProcessCommandRunner runner;

    auto request = shRequest("echo \"$SYSFLOW_MARKER\"; pwd");
    request.environment["SYSFLOW_MARKER"] = "marker-value";
    request.workingDirectory = dir.path();
    auto outcome = runner.run(request);

    REQUIRE(outcome.success());
    REQUIRE(outcome.stdOut.find("marker-value\n") == 0);
    REQUIRE(outcome.stdOut.find(std::filesystem::path(dir.path()).filename().string()) != std::string::npos);
}

TEST_CASE("Child stdin is closed", "[ProcessCommandRunner][Integration]") {
    ProcessCommandRunner runner;
    auto outcome = runner.run(shRequest("cat; echo done"));
    REQUIRE(outcome.success());
    REQUIRE(outcome.stdOut == "done\n");
}

TEST_CASE("Timeout kills the command", "[ProcessCommandRunner][Integration]") {
    ProcessCommandRunner runner;
    auto request = shRequest("sleep 5");
    request.timeout = std::chrono::seconds(1);

    auto start = std::chrono::steady_clock::now();
    auto outcome = runner.run(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(outcome.timedOut);
    REQUIRE(outcome.exitCode == ProcessCommandRunner::kTimeoutExitCode);
    REQUIRE(elapsed < std::chrono::seconds(4));
}

TEST_CASE("Missing interpreter is a launch failure", "[ProcessCommandRunner][Integration]") {
    ProcessCommandRunner runner;
    auto request = shRequest("echo hi");
    request.shell = "/nonexistent/bash";
    auto outcome = runner.run(request);

    REQUIRE(outcome.exitCode == ProcessCommandRunner::kLaunchFailureExitCode);
    REQUIRE(outcome.stdErr.find("Interpreter not found") != std::string::npos);
}

TEST_CASE("Unsupported interpreter is a launch failure", "[ProcessCommandRunner][Integration]") {
    ProcessCommandRunner runner;
    auto request = shRequest("print 1");
    request.shell = "awk";
    auto outcome = runner.run(request);

    REQUIRE(outcome.exitCode == ProcessCommandRunner::kLaunchFailureExitCode);
    REQUIRE(outcome.stdErr.find("Unsupported interpreter: awk") != std::string::npos);
}

TEST_CASE("Perl runs inline code", "[ProcessCommandRunner][Integration]") {
    try {
        ProcessCommandRunner::interpreterCommand("perl");
    } catch (const std::runtime_error&) {
        return;  // perl not installed
    }

    ProcessCommandRunner runner;
    auto request = shRequest("print \"ran\\n\"; exit 3;");
    request.shell = "perl";
    auto outcome = runner.run(request);

    REQUIRE(outcome.exitCode == 3);
    REQUIRE(outcome.stdOut == "ran\n");
}

// =============================================================================
// End to end
// =============================================================================

TEST_CASE("Engine runs a real workflow", "[WorkflowEngine][Integration]") {
    WorkflowEngine engine;
    engine.setDefaultShell("sh");

    auto wf = WorkflowParser::parse(R"(
name: demo
steps:
  - name: s1
    run: echo hi
    output: greeting
  - name: s2
    run: echo ${greeting}
    when: greeting == "hi"
)");
    auto result = engine.run(wf);

    REQUIRE(result.success);
    REQUIRE(result.steps.size() == 2);
    REQUIRE(result.steps[1].command == "echo hi");
    REQUIRE(result.steps[1].stdOut == "hi\n");
}

TEST_CASE("Engine stops on a real failure", "[WorkflowEngine][Integration]") {
    WorkflowEngine engine;
    engine.setDefaultShell("sh");

    auto wf = WorkflowParser::parse(R"(
name: failing
steps:
  - name: s1
    run: exit 1
  - name: s2
    run: echo unreachable
)");
    auto result = engine.run(wf);

    REQUIRE_FALSE(result.success);
    REQUIRE(result.steps.size() == 1);
    REQUIRE(result.steps[0].exitCode == 1);
}

TEST_CASE("Engine times out a real step", "[WorkflowEngine][Integration]") {
    WorkflowEngine engine;
    engine.setDefaultShell("sh");

    auto wf = WorkflowParser::parse(R"(
name: slow
steps:
  - name: nap
    run: sleep 5
    timeout: 1
)");
    auto result = engine.run(wf);

    REQUIRE_FALSE(result.success);
    REQUIRE(result.steps[0].timedOut);
    REQUIRE(result.steps[0].exitCode == 124);
    REQUIRE(result.steps[0].duration < 4.0);
}
