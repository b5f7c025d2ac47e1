#include "workflow/WorkflowValidator.hpp"
#include "workflow/CommandRunner.hpp"
#include "workflow/ConditionEvaluator.hpp"
#include "workflow/TemplateRenderer.hpp"
#include "workflow/WorkflowError.hpp"
#include <algorithm>
#include <set>

namespace sysflow {
namespace workflow {

WorkflowValidator::WorkflowValidator()
    : m_environment(ExecutionContext::processEnvironment())
{}

WorkflowValidator::WorkflowValidator(VariableMap environment)
    : m_environment(std::move(environment))
{}

std::string WorkflowValidator::describeStep(size_t index, const WorkflowStep& step) {
    std::string label = "Step " + std::to_string(index + 1);
    if (!step.name.empty()) {
        label += " '" + step.name + "'";
    }
    return label;
}

void WorkflowValidator::checkTemplate(const std::string& text, const std::string& owner,
                                      std::vector<std::string>& errors) const {
    try {
        TemplateRenderer::scan(text);
    } catch (const TemplateError& e) {
        errors.push_back(owner + " has an invalid placeholder '" + e.text() + "': " + e.detail());
    }
}

void WorkflowValidator::checkReferences(const Workflow& workflow,
                                        std::vector<std::string>& warnings) const {
    std::set<std::string> defined;
    for (const auto& [name, value] : workflow.env) {
        defined.insert(name);
    }

    for (size_t i = 0; i < workflow.steps.size(); ++i) {
        const auto& step = workflow.steps[i];
        std::vector<std::string> names;
        try {
            names = TemplateRenderer::references(step.run);
        } catch (const TemplateError&) {
            // Already reported as an error
        }
        for (const auto& name : names) {
            if (defined.count(name) == 0 && m_environment.count(name) == 0) {
                warnings.push_back(describeStep(i, step) + " references undefined variable '" + name + "'");
            }
        }
        if (step.output && !step.output->empty()) {
            defined.insert(*step.output);
        }
    }
}

WorkflowValidationResult WorkflowValidator::validate(const Workflow& workflow) const {
    WorkflowValidationResult result;
    auto& errors = result.errors;
    auto& warnings = result.warnings;

    // 1. Name
    if (workflow.name.empty()) {
        errors.push_back("Workflow name is required");
    }

    // 2. Steps
    if (workflow.steps.empty()) {
        errors.push_back("Workflow must have at least one step");
    }

    // 3. Commands
    for (size_t i = 0; i < workflow.steps.size(); ++i) {
        const auto& step = workflow.steps[i];
        if (step.run.empty()) {
            errors.push_back(describeStep(i, step) + " must have a 'run' command");
        }
    }

    // 4. Numeric ranges
    auto checkRange = [&errors](size_t i, const WorkflowStep& step, const char* field,
                                const std::optional<int>& value, int maximum) {
        if (!value) return;
        if (*value < 0) {
            errors.push_back(describeStep(i, step) + " has invalid " + field + ": " + std::to_string(*value));
        } else if (*value > maximum) {
            errors.push_back(describeStep(i, step) + " has invalid " + field + ": " + std::to_string(*value) +
                             " (maximum " + std::to_string(maximum) + ")");
        }
    };
    for (size_t i = 0; i < workflow.steps.size(); ++i) {
        const auto& step = workflow.steps[i];
        checkRange(i, step, "timeout", step.timeout, WorkflowStep::kMaxTimeoutSeconds);
        checkRange(i, step, "retries", step.retries, WorkflowStep::kMaxRetries);
        checkRange(i, step, "retry_delay", step.retryDelay, WorkflowStep::kMaxRetryDelaySeconds);
    }

    // 5. Conditions
    for (size_t i = 0; i < workflow.steps.size(); ++i) {
        const auto& step = workflow.steps[i];
        if (!step.when) continue;
        if (auto problem = ConditionEvaluator::check(*step.when)) {
            errors.push_back(describeStep(i, step) + " has invalid condition '" + *step.when + "': " + *problem);
        }
    }

    // 6. Duplicate names
    std::set<std::string> seen;
    std::set<std::string> reported;
    for (const auto& step : workflow.steps) {
        if (step.name.empty()) continue;
        if (!seen.insert(step.name).second && reported.insert(step.name).second) {
            warnings.push_back("Duplicate step name: " + step.name);
        }
    }

    // 7. Error handler that can never fire
    bool hasHandlerCommand = std::any_of(workflow.onError.begin(), workflow.onError.end(),
        [](const WorkflowErrorHandler& h) { return h.run.has_value(); });
    bool canFail = std::any_of(workflow.steps.begin(), workflow.steps.end(),
        [](const WorkflowStep& s) { return !s.tolerateFailure(); });
    if (hasHandlerCommand && !canFail) {
        warnings.push_back("on_error 'run' handler will never fire: no step can fail the workflow");
    }

    // 8. Placeholders
    for (size_t i = 0; i < workflow.steps.size(); ++i) {
        checkTemplate(workflow.steps[i].run, describeStep(i, workflow.steps[i]), errors);
    }
    for (size_t i = 0; i < workflow.onError.size(); ++i) {
        const auto& handler = workflow.onError[i];
        std::string owner = "on_error " + std::to_string(i + 1);
        if (handler.notify) checkTemplate(*handler.notify, owner + " notify", errors);
        if (handler.run) checkTemplate(*handler.run, owner + " run", errors);
    }

    // 9. Empty handlers
    for (size_t i = 0; i < workflow.onError.size(); ++i) {
        const auto& handler = workflow.onError[i];
        if (!handler.notify && !handler.run) {
            errors.push_back("on_error " + std::to_string(i + 1) + " must define 'notify' or 'run'");
        }
    }

    for (size_t i = 0; i < workflow.steps.size(); ++i) {
        const auto& step = workflow.steps[i];

        // 10. Unnamed steps
        if (step.name.empty()) {
            warnings.push_back(describeStep(i, step) + " has no name");
        }

        // 11. Zero timeout
        if (step.timeout && *step.timeout == 0) {
            warnings.push_back(describeStep(i, step) + " has timeout 0, no limit will be enforced");
        }

        // 12. Output names
        if (step.output && !TemplateRenderer::isValidName(*step.output)) {
            warnings.push_back(describeStep(i, step) + " output variable '" + *step.output +
                               "' is not a valid identifier and cannot be referenced");
        }
    }

    // 13. Unresolvable references
    checkReferences(workflow, warnings);

    // 14. Interpreters
    for (size_t i = 0; i < workflow.steps.size(); ++i) {
        const auto& step = workflow.steps[i];
        if (step.shell && !step.shell->empty() && !ProcessCommandRunner::inlineFlag(*step.shell)) {
            errors.push_back(describeStep(i, step) + " has unsupported shell '" + *step.shell + "'");
        }
    }

    result.valid = errors.empty();
    return result;
}

} // namespace workflow
} // namespace sysflow
