#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sysflow {
namespace workflow {

/**
 * One command invocation handed to a runner
 */
struct CommandRequest {
    std::string command;                         // Rendered command text
    std::string shell;                           // Interpreter name or path, empty = runner default
    std::string workingDirectory;                // Empty = current directory
    std::map<std::string, std::string> environment;  // Complete child environment
    std::optional<std::chrono::seconds> timeout;     // Absent = no limit
};

/**
 * What came back from one invocation
 */
struct CommandOutcome {
    int exitCode = 0;
    std::string stdOut;
    std::string stdErr;
    bool timedOut = false;

    bool success() const { return exitCode == 0 && !timedOut; }
};

/**
 * Executes commands on behalf of the step executor.
 * Each call is an independent invocation; implementations must not throw
 * for command failures and report them through CommandOutcome instead.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandOutcome run(const CommandRequest& request) = 0;
};

/**
 * Runs each command as a child process through Boost.Process.
 *
 * The child is started in its own process group with stdin closed;
 * stdout and stderr are collected asynchronously on a private io_context.
 * When the timeout expires the whole group is killed and the outcome is
 * flagged timedOut with exit code 124.
 */
class ProcessCommandRunner : public CommandRunner {
public:
    static constexpr int kTimeoutExitCode = 124;
    static constexpr int kLaunchFailureExitCode = 127;

    explicit ProcessCommandRunner(std::string defaultShell = "bash");

    CommandOutcome run(const CommandRequest& request) override;

    const std::string& getDefaultShell() const { return m_defaultShell; }
    void setDefaultShell(const std::string& shell) { m_defaultShell = shell; }

    /**
     * Flag that makes an interpreter run its next argument as code:
     * "-c" for sh, bash, zsh, dash, ksh, fish and python; "-e" for perl,
     * ruby and node. Matched on the basename, so "/usr/bin/perl" works.
     * Empty for interpreters that cannot run inline code.
     */
    static std::optional<std::string> inlineFlag(const std::string& shell);

    /**
     * Resolve an interpreter name to an executable and its leading arguments.
     * python maps to python3.
     * Throws std::runtime_error when the interpreter is unsupported or cannot be found.
     */
    static std::vector<std::string> interpreterCommand(const std::string& shell);

private:
    std::string m_defaultShell;
};

} // namespace workflow
} // namespace sysflow
