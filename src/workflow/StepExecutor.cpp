#include "workflow/StepExecutor.hpp"
#include "workflow/ConditionEvaluator.hpp"
#include "workflow/TemplateRenderer.hpp"
#include "workflow/WorkflowError.hpp"
#include "util/Logger.hpp"

namespace sysflow {
namespace workflow {

StepExecutor::StepExecutor(CommandRunner& runner, Clock& clock)
    : m_runner(runner)
    , m_clock(clock)
{}

std::string StepExecutor::trimTrailingNewlines(const std::string& text) {
    size_t end = text.size();
    while (end > 0 && (text[end - 1] == '\n' || text[end - 1] == '\r')) {
        --end;
    }
    return text.substr(0, end);
}

StepExecutor::Preparation StepExecutor::prepare(const WorkflowStep& step,
                                                const ExecutionContext& context) {
    Preparation prep;

    if (step.when) {
        try {
            if (!ConditionEvaluator::evaluate(*step.when, context)) {
                prep.skip = true;
                return prep;
            }
        } catch (const ConditionError& e) {
            prep.failed = true;
            prep.error = e.what();
            return prep;
        }
    }

    try {
        prep.command = TemplateRenderer::render(step.run, context);
    } catch (const TemplateError& e) {
        prep.failed = true;
        prep.error = e.what();
    }
    return prep;
}

WorkflowStepResult StepExecutor::failedBeforeLaunch(const WorkflowStep& step, const Preparation& prep) {
    WorkflowStepResult result;
    result.name = step.name;
    result.success = false;
    result.exitCode = 1;
    result.stdErr = prep.error;
    result.command = prep.command;
    return result;
}

WorkflowStepResult StepExecutor::execute(const WorkflowStep& step, ExecutionContext& context) {
    auto prep = prepare(step, context);
    if (prep.skip) {
        LOG_DEBUG("Step '" + step.name + "' skipped, condition not met: " + step.when.value_or(""));
        return WorkflowStepResult::skippedStep(step.name);
    }
    if (prep.failed) {
        LOG_WARN("Step '" + step.name + "' cannot run: " + prep.error);
        return failedBeforeLaunch(step, prep);
    }

    CommandRequest request;
    request.command = prep.command;
    request.shell = step.shell.value_or(m_defaultShell);
    request.workingDirectory = context.getWorkingDirectory();
    request.environment = context.mergedEnvironment();
    if (step.timeout && *step.timeout > 0) {
        request.timeout = std::chrono::seconds(*step.timeout);
    }

    const int maxAttempts = step.maxAttempts();
    const Clock::Duration retryDelay(step.retryDelaySeconds());
    auto startTime = m_clock.now();

    CommandOutcome outcome;
    int attempt = 0;
    while (attempt < maxAttempts) {
        if (attempt > 0) {
            LOG_INFO("Retrying step '" + step.name + "' (attempt " + std::to_string(attempt + 1) +
                     "/" + std::to_string(maxAttempts) + ")");
            m_clock.sleep(retryDelay);
        }
        ++attempt;

        outcome = m_runner.run(request);
        if (outcome.success()) {
            break;
        }

        if (outcome.timedOut) {
            LOG_WARN("Step '" + step.name + "' timed out after " + std::to_string(step.timeout.value_or(0)) + "s");
        } else {
            LOG_DEBUG("Step '" + step.name + "' attempt " + std::to_string(attempt) +
                      " exited with code " + std::to_string(outcome.exitCode));
        }
    }

    WorkflowStepResult result;
    result.name = step.name;
    result.success = outcome.success();
    result.exitCode = outcome.exitCode;
    result.stdOut = outcome.stdOut;
    result.stdErr = outcome.stdErr;
    result.duration = m_clock.secondsSince(startTime);
    result.command = prep.command;
    result.attempts = attempt;
    result.timedOut = outcome.timedOut;

    if (outcome.timedOut) {
        if (outcome.exitCode == 0) {
            result.exitCode = ProcessCommandRunner::kTimeoutExitCode;
        }
        std::string message = TimeoutError(step.name).what();
        message += " after " + std::to_string(step.timeout.value_or(0)) + "s";
        result.stdErr = result.stdErr.empty() ? message : result.stdErr + "\n" + message;
    }

    if (result.success && step.output && !step.output->empty()) {
        context.setVariable(*step.output, trimTrailingNewlines(result.stdOut));
    }

    return result;
}

WorkflowStepResult StepExecutor::simulate(const WorkflowStep& step, const ExecutionContext& context) const {
    auto prep = prepare(step, context);
    if (prep.skip) {
        return WorkflowStepResult::skippedStep(step.name);
    }
    if (prep.failed) {
        return failedBeforeLaunch(step, prep);
    }

    WorkflowStepResult result;
    result.name = step.name;
    result.success = true;
    result.exitCode = 0;
    result.stdOut = "[dry-run] Would execute: " + prep.command;
    result.command = prep.command;
    return result;
}

} // namespace workflow
} // namespace sysflow
