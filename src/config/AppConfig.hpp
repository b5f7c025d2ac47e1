#pragma once

#include "util/Logger.hpp"
#include <map>
#include <string>

namespace sysflow {
namespace config {

/**
 * Application settings
 *
 * Precedence: defaults < config file < environment < command line.
 *
 * Config file format (key=value, one per line, '#' comments):
 *   workflows_dir = ~/.sysflow/workflows
 *   default_shell = bash
 *   log_level = warn
 *   log_file = /var/log/sysflow.log
 */
struct AppConfig {
    std::string workflowsDir = "~/.sysflow/workflows";
    std::string defaultShell = "bash";
    util::LogLevel logLevel = util::LogLevel::WARN;
    std::string logFile;

    /**
     * Apply key=value pairs. Unknown keys are logged and ignored.
     * Throws std::invalid_argument on an invalid value.
     */
    void apply(const std::map<std::string, std::string>& values);

    /**
     * Apply SYSFLOW_WORKFLOWS_DIR, SYSFLOW_DEFAULT_SHELL, SYSFLOW_LOG_LEVEL
     */
    void applyEnvironment();

    /**
     * Read a config file; a leading '@' is stripped.
     * Throws std::runtime_error when the file cannot be opened.
     */
    static std::map<std::string, std::string> readFile(const std::string& path);

    /**
     * Parse key=value text; malformed lines are logged and skipped
     */
    static std::map<std::string, std::string> parse(const std::string& text);
};

} // namespace config
} // namespace sysflow
