#include "workflow/CommandRunner.hpp"
#include "util/Logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <filesystem>
#include <future>
#include <map>
#include <stdexcept>
#include <system_error>

namespace bp = boost::process;

namespace sysflow {
namespace workflow {

namespace {

// Grace period for pipes to drain after the process group was killed
constexpr std::chrono::seconds kDrainGrace{2};

std::string collect(std::future<std::string>& stream) {
    if (!stream.valid() ||
        stream.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return "";
    }
    try {
        return stream.get();
    } catch (const std::future_error& e) {
        LOG_DEBUG(std::string("Output stream not collected: ") + e.what());
        return "";
    }
}

} // namespace

ProcessCommandRunner::ProcessCommandRunner(std::string defaultShell)
    : m_defaultShell(std::move(defaultShell))
{}

std::optional<std::string> ProcessCommandRunner::inlineFlag(const std::string& shell) {
    static const std::map<std::string, std::string> flags = {
        {"sh", "-c"}, {"bash", "-c"}, {"zsh", "-c"}, {"dash", "-c"}, {"ksh", "-c"}, {"fish", "-c"},
        {"python", "-c"}, {"python3", "-c"},
        {"perl", "-e"}, {"ruby", "-e"}, {"node", "-e"}
    };
    auto it = flags.find(boost::filesystem::path(shell).filename().string());
    if (it == flags.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ProcessCommandRunner::interpreterCommand(const std::string& shell) {
    auto flag = inlineFlag(shell);
    if (!flag) {
        throw std::runtime_error("Unsupported interpreter: " + shell);
    }

    std::string name = shell;
    if (name == "python") {
        name = "python3";
    }

    boost::filesystem::path executable;
    if (name.find('/') != std::string::npos) {
        executable = name;
        if (!boost::filesystem::exists(executable)) {
            executable.clear();
        }
    } else {
        executable = bp::search_path(name);
    }

    if (executable.empty() && name == "bash" && boost::filesystem::exists("/bin/sh")) {
        LOG_DEBUG("bash not found on PATH, falling back to /bin/sh");
        executable = "/bin/sh";
    }

    if (executable.empty()) {
        throw std::runtime_error("Interpreter not found: " + shell);
    }

    return {executable.string(), *flag};
}

CommandOutcome ProcessCommandRunner::run(const CommandRequest& request) {
    CommandOutcome outcome;

    std::vector<std::string> argv;
    try {
        argv = interpreterCommand(request.shell.empty() ? m_defaultShell : request.shell);
    } catch (const std::runtime_error& e) {
        outcome.exitCode = kLaunchFailureExitCode;
        outcome.stdErr = e.what();
        return outcome;
    }
    std::string executable = argv.front();
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    args.push_back(request.command);

    std::string workingDirectory = request.workingDirectory.empty()
        ? std::filesystem::current_path().string()
        : request.workingDirectory;

    bp::environment environment;
    for (const auto& [key, value] : request.environment) {
        environment[key] = value;
    }

    boost::asio::io_context ios;
    std::future<std::string> stdOut;
    std::future<std::string> stdErr;
    bool exited = false;
    int exitCode = 0;

    bp::group group;
    std::error_code launchError;
    bp::child child(
        bp::exe = executable,
        bp::args = args,
        bp::start_dir = workingDirectory,
        environment,
        bp::std_in.close(),
        bp::std_out > stdOut,
        bp::std_err > stdErr,
        bp::on_exit = [&exited, &exitCode](int code, const std::error_code&) {
            exited = true;
            exitCode = code;
        },
        group,
        ios,
        launchError);

    if (launchError) {
        outcome.exitCode = kLaunchFailureExitCode;
        outcome.stdErr = "Failed to start '" + executable + "': " + launchError.message();
        return outcome;
    }

    if (request.timeout) {
        ios.run_for(*request.timeout);
        if (!ios.stopped()) {
            outcome.timedOut = true;
            LOG_DEBUG("Command exceeded " + std::to_string(request.timeout->count()) +
                      "s, killing process group");
            std::error_code killError;
            group.terminate(killError);
            if (killError) {
                LOG_WARN("Failed to kill timed out process group: " + killError.message());
            }
            ios.run_for(kDrainGrace);
            ios.stop();
        }
    } else {
        ios.run();
    }

    if (!exited && !outcome.timedOut) {
        std::error_code waitError;
        child.wait(waitError);
        if (waitError) {
            LOG_WARN("Failed to wait for child process: " + waitError.message());
        } else {
            exited = true;
            exitCode = child.exit_code();
        }
    }

    outcome.stdOut = collect(stdOut);
    outcome.stdErr = collect(stdErr);
    if (outcome.timedOut) {
        outcome.exitCode = kTimeoutExitCode;
    } else {
        outcome.exitCode = exited ? exitCode : kLaunchFailureExitCode;
    }
    return outcome;
}

} // namespace workflow
} // namespace sysflow
