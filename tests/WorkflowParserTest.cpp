#include <catch2/catch_test_macros.hpp>
#include "workflow/WorkflowError.hpp"
#include "workflow/WorkflowParser.hpp"
#include "TestSupport.hpp"
#include <cstdlib>

using namespace sysflow::workflow;
using sysflow::testing::TempDirectory;

// =============================================================================
// Documents
// =============================================================================

TEST_CASE("Parse minimal workflow", "[WorkflowParser]") {
    auto wf = WorkflowParser::parse(R"(
name: minimal
steps:
  - name: hello
    run: echo hello
)");

    REQUIRE(wf.name == "minimal");
    REQUIRE_FALSE(wf.description.has_value());
    REQUIRE(wf.triggers.empty());
    REQUIRE(wf.env.empty());
    REQUIRE(wf.onError.empty());
    REQUIRE(wf.steps.size() == 1);
    REQUIRE(wf.steps[0].name == "hello");
    REQUIRE(wf.steps[0].run == "echo hello");
    REQUIRE_FALSE(wf.steps[0].shell.has_value());
    REQUIRE_FALSE(wf.steps[0].timeout.has_value());
    REQUIRE(wf.steps[0].maxAttempts() == 1);
    REQUIRE_FALSE(wf.steps[0].tolerateFailure());
}

TEST_CASE("Parse full workflow", "[WorkflowParser]") {
    auto wf = WorkflowParser::parse(R"(
name: morning
description: Morning routine
version: "1.2"
author: ops
triggers:
  schedule: "0 9 * * *"
  manual: true
env:
  TARGET: world
  EMPTY:
steps:
  - name: greet
    run: echo "Hello ${TARGET}"
    shell: zsh
    output: greeting
    timeout: 30
    retries: 2
    retry_delay: 5
  - name: optional
    run: exit 1
    when: greeting != ""
    continue_on_error: true
on_error:
  - notify: "Failed: ${error}"
  - run: echo cleanup
)");

    REQUIRE(wf.name == "morning");
    REQUIRE(wf.description == std::optional<std::string>("Morning routine"));
    REQUIRE(wf.version == std::optional<std::string>("1.2"));
    REQUIRE(wf.author == std::optional<std::string>("ops"));

    REQUIRE(wf.triggers.size() == 1);
    REQUIRE(wf.triggers[0].schedule == std::optional<std::string>("0 9 * * *"));
    REQUIRE(wf.triggers[0].manual == std::optional<bool>(true));

    REQUIRE(wf.env.at("TARGET") == "world");
    REQUIRE(wf.env.at("EMPTY") == "");

    REQUIRE(wf.steps.size() == 2);
    const auto& greet = wf.steps[0];
    REQUIRE(greet.run == "echo \"Hello ${TARGET}\"");
    REQUIRE(greet.shell == std::optional<std::string>("zsh"));
    REQUIRE(greet.output == std::optional<std::string>("greeting"));
    REQUIRE(greet.timeout == std::optional<int>(30));
    REQUIRE(greet.retries == std::optional<int>(2));
    REQUIRE(greet.retryDelay == std::optional<int>(5));
    REQUIRE(greet.maxAttempts() == 3);
    REQUIRE(greet.retryDelaySeconds() == 5);

    const auto& optional = wf.steps[1];
    REQUIRE(optional.when == std::optional<std::string>("greeting != \"\""));
    REQUIRE(optional.tolerateFailure());

    REQUIRE(wf.onError.size() == 2);
    REQUIRE(wf.onError[0].notify == std::optional<std::string>("Failed: ${error}"));
    REQUIRE_FALSE(wf.onError[0].run.has_value());
    REQUIRE(wf.onError[1].run == std::optional<std::string>("echo cleanup"));
}

TEST_CASE("Triggers may be a list", "[WorkflowParser]") {
    auto wf = WorkflowParser::parse(R"(
name: listed
triggers:
  - schedule: "*/5 * * * *"
  - event: disk_full
steps:
  - run: df -h
)");

    REQUIRE(wf.triggers.size() == 2);
    REQUIRE(wf.triggers[0].label() == "schedule(*/5 * * * *)");
    REQUIRE(wf.triggers[1].label() == "disk_full");
}

TEST_CASE("Step without name gets empty name", "[WorkflowParser]") {
    auto wf = WorkflowParser::parse(R"(
name: anonymous
steps:
  - run: true
)");
    REQUIRE(wf.steps[0].name.empty());
    REQUIRE(wf.steps[0].run == "true");
}

TEST_CASE("Numeric scalars are accepted as strings", "[WorkflowParser]") {
    auto wf = WorkflowParser::parse(R"(
name: 42
env:
  PORT: 8080
steps:
  - run: echo
)");
    REQUIRE(wf.name == "42");
    REQUIRE(wf.env.at("PORT") == "8080");
}

TEST_CASE("Templates and conditions are kept verbatim", "[WorkflowParser]") {
    auto wf = WorkflowParser::parse(R"(
name: raw
steps:
  - run: echo ${unterminated
    when: "a =="
)");
    REQUIRE(wf.steps[0].run == "echo ${unterminated");
    REQUIRE(wf.steps[0].when == std::optional<std::string>("a =="));
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("Invalid YAML throws ParseError", "[WorkflowParser][Errors]") {
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: [unclosed"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse(""), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("- just\n- a list\n"), ParseError);
}

TEST_CASE("Missing required fields throw ParseError", "[WorkflowParser][Errors]") {
    REQUIRE_THROWS_AS(WorkflowParser::parse("steps:\n  - run: ls\n"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\n"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\nsteps: []\n"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\nsteps:\n  - name: no-run\n"), ParseError);
}

TEST_CASE("Wrongly typed fields throw ParseError", "[WorkflowParser][Errors]") {
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\nsteps: ls\n"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\nsteps:\n  - run: ls\n    timeout: soon\n"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\nsteps:\n  - run: ls\n    continue_on_error: maybe\n"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\nsteps:\n  - run: [a, b]\n"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\nenv: [a]\nsteps:\n  - run: ls\n"), ParseError);
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\nsteps:\n  - ls\n"), ParseError);
}

TEST_CASE("ParseError names the offending step", "[WorkflowParser][Errors]") {
    try {
        WorkflowParser::parse("name: x\nsteps:\n  - run: ok\n  - name: build\n    retries: lots\n    run: make\n");
        FAIL("expected ParseError");
    } catch (const ParseError& e) {
        std::string message = e.what();
        REQUIRE(message.find("Failed to parse workflow") == 0);
        REQUIRE(message.find("step 2 'build'") != std::string::npos);
        REQUIRE(message.find("retries") != std::string::npos);
    }
}

TEST_CASE("Parse errors are WorkflowErrors", "[WorkflowParser][Errors]") {
    REQUIRE_THROWS_AS(WorkflowParser::parse("name: x\n"), WorkflowError);
}

// =============================================================================
// Files
// =============================================================================

TEST_CASE("Load workflow from file", "[WorkflowParser][Files]") {
    TempDirectory dir;
    auto path = dir.write("flow.yaml", "name: from-file\nsteps:\n  - run: echo hi\n");
    auto wf = WorkflowParser::load(path);
    REQUIRE(wf.name == "from-file");
}

TEST_CASE("Missing file throws FileNotFoundError", "[WorkflowParser][Files]") {
    TempDirectory dir;
    auto missing = dir.path() + "/nope.yaml";
    try {
        WorkflowParser::load(missing);
        FAIL("expected FileNotFoundError");
    } catch (const FileNotFoundError& e) {
        REQUIRE(e.path() == missing);
        REQUIRE(std::string(e.what()) == "Workflow file not found: " + missing);
    }
}

TEST_CASE("Directory path is not a workflow file", "[WorkflowParser][Files]") {
    TempDirectory dir;
    REQUIRE_THROWS_AS(WorkflowParser::load(dir.path()), FileNotFoundError);
}

TEST_CASE("Tilde expansion", "[WorkflowParser][Files]") {
    const char* home = std::getenv("HOME");
    if (!home) {
        return;
    }
    REQUIRE(WorkflowParser::expandPath("~/flows") == std::string(home) + "/flows");
    REQUIRE(WorkflowParser::expandPath("~") == std::string(home));
    REQUIRE(WorkflowParser::expandPath("~other/flows") == "~other/flows");
    REQUIRE(WorkflowParser::expandPath("/abs/path") == "/abs/path");
}
