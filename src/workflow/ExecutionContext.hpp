#pragma once

#include <map>
#include <string>

namespace sysflow {
namespace workflow {

struct Workflow;

using VariableMap = std::map<std::string, std::string>;

/**
 * Mutable state threaded through one workflow run.
 *
 * Variables are seeded from the workflow's env block and updated by step
 * outputs. The environment is a snapshot taken at construction and stays
 * read-only for the whole run.
 *
 * Usage:
 *   ExecutionContext ctx = ExecutionContext::forWorkflow(wf, "/tmp");
 *   ctx.setVariable("greeting", "hi");
 *   ctx.lookup("greeting");   // "hi"
 *   ctx.lookup("HOME");       // falls back to the environment
 */
class ExecutionContext {
public:
    ExecutionContext();
    ExecutionContext(VariableMap env, std::string workingDirectory);

    /**
     * Fresh context for a run: process environment snapshot, workflow env
     * merged into variables
     */
    static ExecutionContext forWorkflow(const Workflow& workflow,
                                        const std::string& workingDirectory = "");

    /**
     * Snapshot of the current process environment
     */
    static VariableMap processEnvironment();

    // === Variables ===

    void setVariable(const std::string& name, const std::string& value);
    bool hasVariable(const std::string& name) const;
    const VariableMap& getVariables() const { return m_variables; }

    // === Environment (read-only) ===

    const VariableMap& getEnv() const { return m_env; }

    // === Lookup ===

    /**
     * variables[name], else env[name], else ""
     */
    std::string lookup(const std::string& name) const;

    /**
     * Environment passed to subprocesses: env overlaid with variables
     */
    VariableMap mergedEnvironment() const;

    const std::string& getWorkingDirectory() const { return m_workingDirectory; }

private:
    VariableMap m_variables;
    VariableMap m_env;
    std::string m_workingDirectory;
};

} // namespace workflow
} // namespace sysflow
