#include "config/AppConfig.hpp"
#include "storage/WorkflowCatalog.hpp"
#include "util/Logger.hpp"
#include "workflow/WorkflowEngine.hpp"
#include "workflow/WorkflowError.hpp"
#include "workflow/WorkflowParser.hpp"
#include "workflow/WorkflowSerializer.hpp"
#include "workflow/WorkflowValidator.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace sysflow;
using workflow::json;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string command;
    std::vector<std::string> positional;
    bool dryRun = false;
    bool verbose = false;
    bool json = false;
    bool errorsOnly = false;
    bool force = false;
    bool toStdout = false;
    bool help = false;
    std::optional<std::string> workdir;
    std::optional<std::string> dir;
    std::optional<std::string> description;
    std::optional<std::string> configFile;
    std::optional<std::string> logLevel;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]\n"
              << "\n"
              << "Define and run multi-step YAML automations.\n"
              << "\n"
              << "Commands:\n"
              << "  run <file>           Execute a workflow file\n"
              << "  validate <file>      Check workflow syntax and structure\n"
              << "  list                 List saved workflows\n"
              << "  new <name>           Create a new workflow from template\n"
              << "\n"
              << "Options:\n"
              << "  --dry-run            (run) Show what would run without executing\n"
              << "  -v, --verbose        (run, list) Show detailed output\n"
              << "  --json               Output as JSON\n"
              << "  --workdir DIR        (run) Working directory for steps\n"
              << "  --errors-only        (validate) Only show errors, not warnings\n"
              << "  --dir DIR            (list, new) Workflow directory (default: ~/.sysflow/workflows)\n"
              << "  -d, --description T  (new) Description for the workflow\n"
              << "  --force              (new) Overwrite an existing file\n"
              << "  --stdout             (new) Print to stdout instead of creating a file\n"
              << "  --config FILE        Settings file (key=value lines, @file syntax)\n"
              << "  -l, --log-level LVL  Log level: debug, info, warn, error (default: warn)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " run morning.yaml --dry-run\n"
              << "  " << program << " validate my-workflow.yaml\n"
              << "  " << program << " new backup-routine -d \"Nightly backup\"\n";
}

CliOptions parseArguments(int argc, char* argv[]) {
    CliOptions options;

    auto requireValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Option " + flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--errors-only") {
            options.errorsOnly = true;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "--stdout") {
            options.toStdout = true;
        } else if (arg == "--workdir") {
            options.workdir = requireValue(i, arg);
        } else if (arg == "--dir") {
            options.dir = requireValue(i, arg);
        } else if (arg == "-d" || arg == "--description") {
            options.description = requireValue(i, arg);
        } else if (arg == "--config") {
            options.configFile = requireValue(i, arg);
        } else if (arg == "-l" || arg == "--log-level") {
            options.logLevel = requireValue(i, arg);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

config::AppConfig loadConfig(const CliOptions& options) {
    config::AppConfig appConfig;
    if (options.configFile) {
        appConfig.apply(config::AppConfig::readFile(*options.configFile));
    }
    appConfig.applyEnvironment();
    if (options.logLevel) {
        appConfig.logLevel = util::Logger::parseLevel(*options.logLevel);
    }
    return appConfig;
}

std::string requireFile(const CliOptions& options) {
    if (options.positional.empty()) {
        throw std::invalid_argument("Command '" + options.command + "' requires a workflow file");
    }
    return options.positional.front();
}

// =============================================================================
// Commands
// =============================================================================

int runCommand(const CliOptions& options, const config::AppConfig& appConfig) {
    workflow::WorkflowEngine engine;
    engine.setDefaultShell(appConfig.defaultShell);

    auto wf = workflow::WorkflowParser::load(requireFile(options));

    workflow::WorkflowValidationResult validation;
    try {
        validation = engine.requireValid(wf);
    } catch (const workflow::ValidationError& e) {
        workflow::WorkflowValidationResult invalid;
        invalid.valid = false;
        invalid.errors = e.errors();
        invalid.warnings = e.warnings();
        if (options.json) {
            json output = workflow::WorkflowSerializer::toJson(invalid);
            output["success"] = false;
            std::cout << workflow::WorkflowSerializer::dump(output) << std::endl;
        } else {
            std::cout << invalid.formatted();
        }
        return kExitFailure;
    }

    if (options.verbose && !options.json) {
        for (const auto& warning : validation.warnings) {
            std::cout << "Warning: " << warning << "\n";
        }
    }

    workflow::RunOptions runOptions;
    runOptions.dryRun = options.dryRun;
    runOptions.verbose = options.verbose && !options.json;
    if (options.workdir) {
        runOptions.workingDirectory = workflow::WorkflowParser::expandPath(*options.workdir);
    }

    auto result = engine.run(wf, runOptions);

    if (options.json) {
        std::cout << workflow::WorkflowSerializer::toString(result) << std::endl;
    } else {
        std::cout << result.formatted(options.verbose);
    }
    return result.success ? kExitSuccess : kExitFailure;
}

int validateCommand(const CliOptions& options) {
    workflow::Workflow wf;
    try {
        wf = workflow::WorkflowParser::load(requireFile(options));
    } catch (const workflow::WorkflowError& e) {
        if (options.json) {
            json output;
            output["valid"] = false;
            output["errors"] = json::array({e.what()});
            output["warnings"] = json::array();
            std::cout << workflow::WorkflowSerializer::dump(output) << std::endl;
        } else {
            std::cout << "Error: " << e.what() << std::endl;
        }
        return kExitFailure;
    }

    workflow::WorkflowValidator validator;
    auto result = validator.validate(wf);

    if (options.json) {
        json output = workflow::WorkflowSerializer::toJson(result);
        if (options.errorsOnly) {
            output.erase("warnings");
        }
        output["workflow"] = {
            {"name", wf.name},
            {"description", wf.description.value_or("")},
            {"steps", wf.steps.size()}
        };
        std::cout << workflow::WorkflowSerializer::dump(output) << std::endl;
    } else {
        std::cout << "Workflow: " << wf.name << "\n";
        if (wf.description) {
            std::cout << "Description: " << *wf.description << "\n";
        }
        std::cout << "Steps: " << wf.steps.size() << "\n\n";
        std::cout << "Status: " << (result.valid ? "Valid" : "Invalid") << "\n";
        if (!result.valid) {
            std::cout << "\nErrors:\n";
            for (const auto& error : result.errors) {
                std::cout << "  - " << error << "\n";
            }
        }
        if (!options.errorsOnly && !result.warnings.empty()) {
            std::cout << "\nWarnings:\n";
            for (const auto& warning : result.warnings) {
                std::cout << "  - " << warning << "\n";
            }
        }
    }
    return result.valid ? kExitSuccess : kExitFailure;
}

int listCommand(const CliOptions& options, const config::AppConfig& appConfig) {
    storage::WorkflowCatalog catalog(appConfig.workflowsDir);
    auto workflows = catalog.listWorkflows(options.dir);

    if (options.json) {
        json output = json::array();
        for (const auto& [path, wf] : workflows) {
            output.push_back(workflow::WorkflowSerializer::summaryToJson(path, wf));
        }
        std::cout << workflow::WorkflowSerializer::dump(output) << std::endl;
        return kExitSuccess;
    }

    if (workflows.empty()) {
        std::cout << "No workflows found in " << options.dir.value_or(appConfig.workflowsDir) << "\n"
                  << "\nCreate a workflow with: sysflow new <name>\n";
        return kExitSuccess;
    }

    std::cout << "Workflows (" << workflows.size() << "):\n\n";
    for (const auto& [path, wf] : workflows) {
        std::cout << "  " << wf.name << "\n";
        if (wf.description) {
            std::cout << "    " << *wf.description << "\n";
        }
        if (options.verbose) {
            std::cout << "    Path: " << path << "\n";
            std::cout << "    Steps: " << wf.steps.size() << "\n";
            if (wf.version) {
                std::cout << "    Version: " << *wf.version << "\n";
            }
            auto triggers = workflow::WorkflowSerializer::triggerLabels(wf);
            if (!triggers.empty()) {
                std::cout << "    Triggers: ";
                for (size_t i = 0; i < triggers.size(); ++i) {
                    std::cout << (i > 0 ? ", " : "") << triggers[i];
                }
                std::cout << "\n";
            }
        }
        std::cout << "\n";
    }
    return kExitSuccess;
}

int newCommand(const CliOptions& options, const config::AppConfig& appConfig) {
    if (options.positional.empty()) {
        throw std::invalid_argument("Command 'new' requires a workflow name");
    }
    const std::string& name = options.positional.front();

    if (options.toStdout) {
        std::cout << storage::WorkflowTemplate::generate(name, options.description);
        return kExitSuccess;
    }

    storage::WorkflowCatalog catalog(appConfig.workflowsDir);
    auto path = catalog.createWorkflow(name, options.description, options.dir, options.force);

    std::cout << "Created workflow: " << path << "\n"
              << "\nRun with: sysflow run " << path << "\n"
              << "Validate with: sysflow validate " << path << "\n";
    return kExitSuccess;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    if (options.help || options.command.empty()) {
        printUsage(argv[0]);
        return options.help ? kExitSuccess : kExitUsage;
    }

    try {
        auto appConfig = loadConfig(options);

        // Configure Logger
        util::Logger::instance().setLevel(appConfig.logLevel);
        if (!appConfig.logFile.empty()) {
            util::Logger::instance().enableFileLogging(appConfig.logFile);
        }

        if (options.command == "run") {
            return runCommand(options, appConfig);
        }
        if (options.command == "validate") {
            return validateCommand(options);
        }
        if (options.command == "list") {
            return listCommand(options, appConfig);
        }
        if (options.command == "new") {
            return newCommand(options, appConfig);
        }

        std::cerr << "Error: Unknown command: " << options.command << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}
