#pragma once

#include "workflow/ExecutionContext.hpp"
#include "workflow/Workflow.hpp"

namespace sysflow {
namespace workflow {

/**
 * Structural and semantic checks on a parsed workflow.
 *
 * Never throws, never mutates the workflow, and returns identical results
 * for identical input. Checks run in a fixed order and accumulate.
 */
class WorkflowValidator {
public:
    /**
     * Uses a snapshot of the process environment to decide whether
     * ${NAME} references can be resolved
     */
    WorkflowValidator();
    explicit WorkflowValidator(VariableMap environment);

    WorkflowValidationResult validate(const Workflow& workflow) const;

private:
    VariableMap m_environment;

    static std::string describeStep(size_t index, const WorkflowStep& step);

    void checkTemplate(const std::string& text, const std::string& owner,
                       std::vector<std::string>& errors) const;
    void checkReferences(const Workflow& workflow, std::vector<std::string>& warnings) const;
};

} // namespace workflow
} // namespace sysflow
