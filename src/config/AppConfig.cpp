#include "config/AppConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sysflow {
namespace config {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

} // namespace

std::map<std::string, std::string> AppConfig::parse(const std::string& text) {
    std::map<std::string, std::string> values;
    std::istringstream input(text);
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Ignoring malformed config line " + std::to_string(lineNumber) + ": " + line);
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }
        values[key] = val;
    }
    return values;
}

std::map<std::string, std::string> AppConfig::readFile(const std::string& path) {
    std::string filePath = !path.empty() && path[0] == '@' ? path.substr(1) : path;
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }
    std::ostringstream content;
    content << file.rdbuf();
    auto values = parse(content.str());
    LOG_DEBUG("Loaded " + std::to_string(values.size()) + " settings from " + filePath);
    return values;
}

void AppConfig::apply(const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        if (key == "workflows_dir") {
            workflowsDir = value;
        } else if (key == "default_shell") {
            if (value.empty()) {
                throw std::invalid_argument("default_shell must not be empty");
            }
            defaultShell = value;
        } else if (key == "log_level") {
            logLevel = util::Logger::parseLevel(value);
        } else if (key == "log_file") {
            logFile = value;
        } else {
            LOG_WARN("Unknown config key: " + key);
        }
    }
}

void AppConfig::applyEnvironment() {
    std::map<std::string, std::string> values;
    if (const char* dir = std::getenv("SYSFLOW_WORKFLOWS_DIR")) {
        values["workflows_dir"] = dir;
    }
    if (const char* shell = std::getenv("SYSFLOW_DEFAULT_SHELL")) {
        values["default_shell"] = shell;
    }
    if (const char* level = std::getenv("SYSFLOW_LOG_LEVEL")) {
        values["log_level"] = level;
    }
    apply(values);
}

} // namespace config
} // namespace sysflow
