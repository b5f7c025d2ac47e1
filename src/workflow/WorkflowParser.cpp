#include "workflow/WorkflowParser.hpp"
#include "workflow/WorkflowError.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sysflow {
namespace workflow {

namespace {

/**
 * Typed accessors over a mapping node, each reporting the field and its
 * owner ("workflow", "step 2", ...) on failure
 */
class FieldReader {
public:
    FieldReader(const YAML::Node& node, std::string owner)
        : m_node(node), m_owner(std::move(owner)) {}

    bool has(const std::string& key) const {
        const YAML::Node value = m_node[key];
        return value.IsDefined() && !value.IsNull();
    }

    YAML::Node get(const std::string& key) const {
        return m_node[key];
    }

    std::optional<std::string> optionalString(const std::string& key) const {
        if (!has(key)) return std::nullopt;
        const YAML::Node value = m_node[key];
        if (!value.IsScalar()) {
            fail("'" + key + "' must be a string");
        }
        return value.as<std::string>();
    }

    std::string requiredString(const std::string& key) const {
        auto value = optionalString(key);
        if (!value) {
            fail("missing required field '" + key + "'");
        }
        return *value;
    }

    std::optional<int> optionalInt(const std::string& key) const {
        if (!has(key)) return std::nullopt;
        const YAML::Node value = m_node[key];
        if (!value.IsScalar()) {
            fail("'" + key + "' must be an integer");
        }
        try {
            return value.as<int>();
        } catch (const YAML::BadConversion&) {
            fail("'" + key + "' must be an integer, got '" + value.Scalar() + "'");
        }
    }

    std::optional<bool> optionalBool(const std::string& key) const {
        if (!has(key)) return std::nullopt;
        const YAML::Node value = m_node[key];
        if (!value.IsScalar()) {
            fail("'" + key + "' must be a boolean");
        }
        try {
            return value.as<bool>();
        } catch (const YAML::BadConversion&) {
            fail("'" + key + "' must be a boolean, got '" + value.Scalar() + "'");
        }
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw ParseError(m_owner + ": " + message);
    }

private:
    YAML::Node m_node;
    std::string m_owner;
};

WorkflowTrigger parseTrigger(const YAML::Node& node, const std::string& owner) {
    if (!node.IsMap()) {
        throw ParseError(owner + ": must be a mapping");
    }
    FieldReader reader(node, owner);
    WorkflowTrigger trigger;
    trigger.schedule = reader.optionalString("schedule");
    trigger.manual = reader.optionalBool("manual");
    trigger.event = reader.optionalString("event");
    return trigger;
}

std::vector<WorkflowTrigger> parseTriggers(const YAML::Node& node) {
    std::vector<WorkflowTrigger> triggers;
    if (node.IsMap()) {
        triggers.push_back(parseTrigger(node, "triggers"));
    } else if (node.IsSequence()) {
        for (size_t i = 0; i < node.size(); ++i) {
            triggers.push_back(parseTrigger(node[i], "trigger " + std::to_string(i + 1)));
        }
    } else {
        throw ParseError("'triggers' must be a mapping or a list of mappings");
    }
    return triggers;
}

std::map<std::string, std::string> parseEnv(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw ParseError("'env' must be a mapping of names to strings");
    }
    std::map<std::string, std::string> env;
    for (const auto& entry : node) {
        std::string key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;
        if (value.IsNull()) {
            env[key] = "";
        } else if (value.IsScalar()) {
            env[key] = value.as<std::string>();
        } else {
            throw ParseError("env: value of '" + key + "' must be a string");
        }
    }
    return env;
}

WorkflowStep parseStep(const YAML::Node& node, size_t index) {
    std::string owner = "step " + std::to_string(index + 1);
    if (!node.IsMap()) {
        throw ParseError(owner + ": must be a mapping");
    }

    FieldReader reader(node, owner);
    WorkflowStep step;
    step.name = reader.optionalString("name").value_or("");
    if (!step.name.empty()) {
        owner += " '" + step.name + "'";
        reader = FieldReader(node, owner);
    }

    step.run = reader.requiredString("run");
    step.shell = reader.optionalString("shell");
    step.output = reader.optionalString("output");
    step.when = reader.optionalString("when");
    step.timeout = reader.optionalInt("timeout");
    step.continueOnError = reader.optionalBool("continue_on_error");
    step.retries = reader.optionalInt("retries");
    step.retryDelay = reader.optionalInt("retry_delay");
    return step;
}

std::vector<WorkflowErrorHandler> parseErrorHandlers(const YAML::Node& node) {
    std::vector<YAML::Node> entries;
    if (node.IsSequence()) {
        for (const auto& entry : node) {
            entries.push_back(entry);
        }
    } else if (node.IsMap()) {
        entries.push_back(node);
    } else {
        throw ParseError("'on_error' must be a list of handlers");
    }

    std::vector<WorkflowErrorHandler> handlers;
    for (size_t i = 0; i < entries.size(); ++i) {
        std::string owner = "on_error " + std::to_string(i + 1);
        if (!entries[i].IsMap()) {
            throw ParseError(owner + ": must be a mapping");
        }
        FieldReader reader(entries[i], owner);
        WorkflowErrorHandler handler;
        handler.notify = reader.optionalString("notify");
        handler.run = reader.optionalString("run");
        handlers.push_back(std::move(handler));
    }
    return handlers;
}

} // namespace

Workflow WorkflowParser::parse(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ParseError(e.what());
    }

    if (!root.IsDefined() || root.IsNull()) {
        throw ParseError("document is empty");
    }
    if (!root.IsMap()) {
        throw ParseError("document must be a mapping");
    }

    try {
        FieldReader reader(root, "workflow");
        Workflow workflow;
        workflow.name = reader.requiredString("name");
        workflow.description = reader.optionalString("description");
        workflow.version = reader.optionalString("version");
        workflow.author = reader.optionalString("author");

        if (reader.has("triggers")) {
            workflow.triggers = parseTriggers(reader.get("triggers"));
        }
        if (reader.has("env")) {
            workflow.env = parseEnv(reader.get("env"));
        }

        if (!reader.has("steps")) {
            reader.fail("missing required field 'steps'");
        }
        const YAML::Node steps = reader.get("steps");
        if (!steps.IsSequence()) {
            reader.fail("'steps' must be a list");
        }
        if (steps.size() == 0) {
            reader.fail("'steps' must not be empty");
        }
        for (size_t i = 0; i < steps.size(); ++i) {
            workflow.steps.push_back(parseStep(steps[i], i));
        }

        if (reader.has("on_error")) {
            workflow.onError = parseErrorHandlers(reader.get("on_error"));
        }
        return workflow;
    } catch (const YAML::Exception& e) {
        throw ParseError(e.what());
    }
}

std::string WorkflowParser::expandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

Workflow WorkflowParser::load(const std::string& path) {
    std::string expanded = expandPath(path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(expanded, ec)) {
        throw FileNotFoundError(expanded);
    }

    std::ifstream file(expanded);
    if (!file.is_open()) {
        throw FileNotFoundError(expanded);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return parse(content.str());
}

} // namespace workflow
} // namespace sysflow
