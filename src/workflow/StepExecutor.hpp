#pragma once

#include "workflow/Clock.hpp"
#include "workflow/CommandRunner.hpp"
#include "workflow/ExecutionContext.hpp"
#include "workflow/Workflow.hpp"
#include <string>

namespace sysflow {
namespace workflow {

/**
 * Runs a single step: guard, substitution, bounded retries, timeout,
 * output capture.
 *
 * Failures never throw; they come back as a result with success = false.
 */
class StepExecutor {
public:
    StepExecutor(CommandRunner& runner, Clock& clock);

    /**
     * Interpreter for steps without a shell override (empty = runner default)
     */
    void setDefaultShell(const std::string& shell) { m_defaultShell = shell; }

    /**
     * Execute the step for real. On success, binds context.variables[output]
     * to the captured stdout without its trailing newline.
     */
    WorkflowStepResult execute(const WorkflowStep& step, ExecutionContext& context);

    /**
     * Dry-run rendition: evaluates the guard and renders the command, never
     * invokes the runner and never touches the context
     */
    WorkflowStepResult simulate(const WorkflowStep& step, const ExecutionContext& context) const;

    /**
     * Strip trailing "\n" / "\r\n" sequences
     */
    static std::string trimTrailingNewlines(const std::string& text);

private:
    CommandRunner& m_runner;
    Clock& m_clock;
    std::string m_defaultShell;

    struct Preparation {
        bool skip = false;
        bool failed = false;
        std::string command;
        std::string error;
    };

    /**
     * Evaluate the guard and render the command once for all attempts
     */
    static Preparation prepare(const WorkflowStep& step, const ExecutionContext& context);

    static WorkflowStepResult failedBeforeLaunch(const WorkflowStep& step, const Preparation& prep);
};

} // namespace workflow
} // namespace sysflow
