#include "workflow/ExecutionContext.hpp"
#include "workflow/Workflow.hpp"
#include <filesystem>

extern char** environ;

namespace sysflow {
namespace workflow {

ExecutionContext::ExecutionContext()
    : m_env(processEnvironment())
    , m_workingDirectory(std::filesystem::current_path().string())
{}

ExecutionContext::ExecutionContext(VariableMap env, std::string workingDirectory)
    : m_env(std::move(env))
    , m_workingDirectory(std::move(workingDirectory))
{
    if (m_workingDirectory.empty()) {
        m_workingDirectory = std::filesystem::current_path().string();
    }
}

ExecutionContext ExecutionContext::forWorkflow(const Workflow& workflow,
                                               const std::string& workingDirectory) {
    ExecutionContext ctx(processEnvironment(), workingDirectory);
    for (const auto& [key, value] : workflow.env) {
        ctx.setVariable(key, value);
    }
    return ctx;
}

VariableMap ExecutionContext::processEnvironment() {
    VariableMap env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string pair(*entry);
        auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    return env;
}

void ExecutionContext::setVariable(const std::string& name, const std::string& value) {
    m_variables[name] = value;
}

bool ExecutionContext::hasVariable(const std::string& name) const {
    return m_variables.find(name) != m_variables.end();
}

std::string ExecutionContext::lookup(const std::string& name) const {
    auto it = m_variables.find(name);
    if (it != m_variables.end()) {
        return it->second;
    }
    auto envIt = m_env.find(name);
    if (envIt != m_env.end()) {
        return envIt->second;
    }
    return "";
}

VariableMap ExecutionContext::mergedEnvironment() const {
    VariableMap merged = m_env;
    for (const auto& [name, value] : m_variables) {
        merged[name] = value;
    }
    return merged;
}

} // namespace workflow
} // namespace sysflow
