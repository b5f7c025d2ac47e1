#include "workflow/WorkflowEngine.hpp"
#include "workflow/TemplateRenderer.hpp"
#include "workflow/WorkflowError.hpp"
#include "util/Logger.hpp"
#include <optional>

namespace sysflow {
namespace workflow {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) joined += separator;
        joined += items[i];
    }
    return joined;
}

} // namespace

const char* runStateName(RunState state) {
    switch (state) {
        case RunState::Pending:   return "pending";
        case RunState::Running:   return "running";
        case RunState::Succeeded: return "succeeded";
        case RunState::Failed:    return "failed";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

WorkflowEngine::WorkflowEngine()
    : m_ownedRunner(std::make_unique<ProcessCommandRunner>())
    , m_runner(*m_ownedRunner)
    , m_clock(SystemClock::instance())
    , m_executor(m_runner, m_clock)
{}

WorkflowEngine::WorkflowEngine(CommandRunner& runner, Clock& clock)
    : m_runner(runner)
    , m_clock(clock)
    , m_executor(m_runner, m_clock)
{}

void WorkflowEngine::setDefaultShell(const std::string& shell) {
    m_defaultShell = shell;
    m_executor.setDefaultShell(shell);
}

void WorkflowEngine::setStepCallback(StepCallback callback) {
    m_callback = std::move(callback);
}

void WorkflowEngine::emit(const StepEvent& event) const {
    if (m_callback) {
        m_callback(event);
    }
}

void WorkflowEngine::transition(RunState& state, RunState next, const std::string& workflow) const {
    LOG_DEBUG("Workflow '" + workflow + "': " + runStateName(state) + " -> " + runStateName(next));
    state = next;
}

WorkflowValidationResult WorkflowEngine::validate(const Workflow& workflow) const {
    return m_validator.validate(workflow);
}

WorkflowValidationResult WorkflowEngine::requireValid(const Workflow& workflow) const {
    auto validation = m_validator.validate(workflow);
    if (!validation.valid) {
        throw ValidationError(validation.errors, validation.warnings);
    }
    return validation;
}

// =============================================================================
// Execution
// =============================================================================

WorkflowResult WorkflowEngine::run(const Workflow& workflow, bool dryRun, bool verbose) {
    RunOptions options;
    options.dryRun = dryRun;
    options.verbose = verbose;
    return run(workflow, options);
}

WorkflowResult WorkflowEngine::run(const Workflow& workflow, const RunOptions& options) {
    auto startTime = m_clock.now();
    RunState state = RunState::Pending;

    WorkflowResult result;
    result.workflow = workflow.name;
    result.dryRun = options.dryRun;

    auto validation = m_validator.validate(workflow);
    if (!validation.valid) {
        result.success = false;
        result.error = "Workflow validation failed: " + join(validation.errors, "; ");
        LOG_ERROR(*result.error);
        result.totalDuration = m_clock.secondsSince(startTime);
        return result;
    }

    ExecutionContext context = ExecutionContext::forWorkflow(workflow, options.workingDirectory);
    transition(state, RunState::Running, workflow.name);
    LOG_INFO(std::string(options.dryRun ? "Simulating" : "Running") + " workflow '" + workflow.name +
             "' (" + std::to_string(workflow.steps.size()) + " steps)");

    std::string failedStep;

    for (size_t i = 0; i < workflow.steps.size(); ++i) {
        const auto& step = workflow.steps[i];

        StepEvent event;
        event.workflow = workflow.name;
        event.step = step.name;
        event.index = i;
        event.status = StepStatus::Started;
        emit(event);

        auto stepResult = options.dryRun
            ? m_executor.simulate(step, context)
            : m_executor.execute(step, context);

        if (stepResult.skipped) {
            if (options.verbose) {
                *m_output << "Skipping step '" << step.name << "' (condition not met)" << std::endl;
            }
            event.status = StepStatus::Skipped;
            emit(event);
            result.steps.push_back(std::move(stepResult));
            continue;
        }

        if (options.verbose) {
            *m_output << "Running step: " << step.name << std::endl;
            if (!stepResult.stdOut.empty()) {
                *m_output << stepResult.stdOut;
                if (stepResult.stdOut.back() != '\n') {
                    *m_output << std::endl;
                }
            }
        }

        event.duration = stepResult.duration;
        event.exitCode = stepResult.exitCode;

        if (stepResult.success) {
            event.status = StepStatus::Completed;
            emit(event);
        } else {
            event.status = StepStatus::Failed;
            event.errorMessage = stepResult.stdErr;
            emit(event);

            if (step.tolerateFailure()) {
                LOG_WARN("Step '" + step.name + "' failed with exit code " +
                         std::to_string(stepResult.exitCode) + ", continuing (continue_on_error)");
                if (options.verbose) {
                    *m_output << "Step '" << step.name << "' failed but continuing (continue_on_error: true)" << std::endl;
                }
            } else if (state != RunState::Failed) {
                failedStep = step.name;
                result.error = StepFailedError(step.name, stepResult.exitCode).what();
                LOG_ERROR(*result.error);
                transition(state, RunState::Failed, workflow.name);
            }
        }

        result.steps.push_back(std::move(stepResult));

        // Dry runs keep simulating to report everything that would run
        if (state == RunState::Failed && !options.dryRun) {
            break;
        }
    }

    if (state == RunState::Failed) {
        runErrorHandlers(workflow, failedStep, context, options, result);
    } else {
        transition(state, RunState::Succeeded, workflow.name);
    }

    result.success = state == RunState::Succeeded;
    result.totalDuration = m_clock.secondsSince(startTime);
    LOG_INFO("Workflow '" + workflow.name + "' " + runStateName(state));
    return result;
}

void WorkflowEngine::runErrorHandlers(const Workflow& workflow,
                                      const std::string& failedStep,
                                      ExecutionContext& context,
                                      const RunOptions& options,
                                      WorkflowResult& result) {
    if (workflow.onError.empty()) {
        return;
    }

    context.setVariable("error", result.error.value_or(""));
    context.setVariable("failed_step", failedStep);

    for (const auto& handler : workflow.onError) {
        if (handler.notify) {
            std::string message;
            try {
                message = TemplateRenderer::render(*handler.notify, context);
            } catch (const TemplateError& e) {
                LOG_WARN(std::string("Notification template not rendered: ") + e.what());
                message = *handler.notify;
            }
            LOG_WARN("Workflow '" + workflow.name + "' notification: " + message);
            result.notifications.push_back(message);
        }

        if (!handler.run) {
            continue;
        }

        std::string command;
        try {
            command = TemplateRenderer::render(*handler.run, context);
        } catch (const TemplateError& e) {
            LOG_ERROR(std::string("Error handler not run: ") + e.what());
            continue;
        }

        // The runner is never called in a dry run
        if (options.dryRun) {
            LOG_INFO("[dry-run] Would run error handler: " + command);
            if (options.verbose) {
                *m_output << "[dry-run] Would run error handler: " << command << std::endl;
            }
            continue;
        }

        CommandRequest request;
        request.command = command;
        request.shell = m_defaultShell;
        request.workingDirectory = context.getWorkingDirectory();
        request.environment = context.mergedEnvironment();

        try {
            auto outcome = m_runner.run(request);
            if (!outcome.success()) {
                LOG_ERROR("Error handler '" + command + "' failed with exit code " +
                          std::to_string(outcome.exitCode) +
                          (outcome.stdErr.empty() ? "" : ": " + outcome.stdErr));
            } else if (options.verbose && !outcome.stdOut.empty()) {
                *m_output << outcome.stdOut;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Error handler '" + command + "' raised: " + e.what());
        }
    }
}

} // namespace workflow
} // namespace sysflow
