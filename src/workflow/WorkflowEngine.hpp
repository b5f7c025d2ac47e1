#pragma once

#include "workflow/Clock.hpp"
#include "workflow/CommandRunner.hpp"
#include "workflow/ExecutionContext.hpp"
#include "workflow/StepEvent.hpp"
#include "workflow/StepExecutor.hpp"
#include "workflow/Workflow.hpp"
#include "workflow/WorkflowValidator.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace sysflow {
namespace workflow {

/**
 * Lifecycle of one run
 */
enum class RunState {
    Pending,
    Running,
    Succeeded,
    Failed
};

const char* runStateName(RunState state);

struct RunOptions {
    bool dryRun = false;
    bool verbose = false;
    std::string workingDirectory;  // Empty = current directory
};

/**
 * Drives a workflow's steps in order.
 *
 * Each run owns a fresh ExecutionContext, so two runs (even of the same
 * workflow) never share variables. Step failures are data: run() always
 * returns an inspectable WorkflowResult.
 *
 * A step failing with continue_on_error does not stop the sequence and does
 * not fail the workflow; any other failure stops it, fires the on_error
 * handlers once and marks the result failed.
 */
class WorkflowEngine {
public:
    /**
     * Real subprocesses and the system clock
     */
    WorkflowEngine();

    /**
     * Injected collaborators, which must outlive the engine
     */
    WorkflowEngine(CommandRunner& runner, Clock& clock);

    WorkflowEngine(const WorkflowEngine&) = delete;
    WorkflowEngine& operator=(const WorkflowEngine&) = delete;

    /**
     * Shell used for on_error commands and steps without a shell override
     */
    void setDefaultShell(const std::string& shell);

    /**
     * Stream receiving verbose progress (default std::cout)
     */
    void setOutputStream(std::ostream* os) { m_output = os ? os : &std::cout; }

    /**
     * Callback for live step events
     */
    void setStepCallback(StepCallback callback);

    WorkflowResult run(const Workflow& workflow, const RunOptions& options);
    WorkflowResult run(const Workflow& workflow, bool dryRun = false, bool verbose = false);

    WorkflowValidationResult validate(const Workflow& workflow) const;

    /**
     * Validate and return the result (warnings only) when valid.
     * Throws ValidationError carrying every error and warning otherwise.
     */
    WorkflowValidationResult requireValid(const Workflow& workflow) const;

private:
    std::unique_ptr<CommandRunner> m_ownedRunner;
    CommandRunner& m_runner;
    Clock& m_clock;
    StepExecutor m_executor;
    WorkflowValidator m_validator;
    StepCallback m_callback;
    std::ostream* m_output = &std::cout;
    std::string m_defaultShell;

    void emit(const StepEvent& event) const;
    void transition(RunState& state, RunState next, const std::string& workflow) const;

    /**
     * Fire on_error handlers once. Handler failures are logged, never raised.
     */
    void runErrorHandlers(const Workflow& workflow,
                          const std::string& failedStep,
                          ExecutionContext& context,
                          const RunOptions& options,
                          WorkflowResult& result);
};

} // namespace workflow
} // namespace sysflow
