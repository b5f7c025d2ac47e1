#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sysflow {
namespace workflow {

/**
 * How a workflow may be started. Advisory only, the engine never schedules.
 */
struct WorkflowTrigger {
    std::optional<std::string> schedule;  // Cron-like expression
    std::optional<bool> manual;
    std::optional<std::string> event;

    /**
     * Short human label: "schedule(0 9 * * *)", "manual" or the event name.
     * Empty when nothing is set.
     */
    std::string label() const;
};

/**
 * A single unit of work: a command, an optional guard, output capture and
 * retry/timeout policy
 */
struct WorkflowStep {
    std::string name;                     // Label for reporting
    std::string run;                      // Command text (required)
    std::optional<std::string> shell;     // Interpreter override
    std::optional<std::string> output;    // Variable receiving trimmed stdout
    std::optional<std::string> when;      // Guard expression
    std::optional<int> timeout;           // Seconds, absent = no limit
    std::optional<bool> continueOnError;
    std::optional<int> retries;
    std::optional<int> retryDelay;        // Seconds between attempts

    // Upper bounds enforced by the validator
    static constexpr int kMaxRetries = 100;
    static constexpr int kMaxTimeoutSeconds = 7 * 24 * 60 * 60;
    static constexpr int kMaxRetryDelaySeconds = 24 * 60 * 60;

    int maxAttempts() const { return 1 + std::clamp(retries.value_or(0), 0, kMaxRetries); }
    int retryDelaySeconds() const { return std::clamp(retryDelay.value_or(0), 0, kMaxRetryDelaySeconds); }
    bool tolerateFailure() const { return continueOnError.value_or(false); }
};

/**
 * Invoked once when the workflow fails
 */
struct WorkflowErrorHandler {
    std::optional<std::string> notify;  // Message template
    std::optional<std::string> run;     // Command template
};

/**
 * In-memory workflow definition. Pure data.
 */
struct Workflow {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> version;
    std::optional<std::string> author;
    std::vector<WorkflowTrigger> triggers;
    std::map<std::string, std::string> env;
    std::vector<WorkflowStep> steps;
    std::vector<WorkflowErrorHandler> onError;
};

/**
 * Outcome of one step. Produced once by the step executor, never mutated.
 */
struct WorkflowStepResult {
    std::string name;
    bool success = false;
    int exitCode = 0;
    std::string stdOut;
    std::string stdErr;
    double duration = 0.0;   // Seconds, all attempts and delays included
    bool skipped = false;

    std::string command;     // Rendered command text (empty when skipped)
    int attempts = 0;        // Process invocations made
    bool timedOut = false;   // Last attempt hit the step timeout

    static WorkflowStepResult skippedStep(const std::string& name);
};

/**
 * Aggregate outcome of one run
 */
struct WorkflowResult {
    std::string workflow;
    bool success = false;
    double totalDuration = 0.0;
    std::vector<WorkflowStepResult> steps;
    std::optional<std::string> error;

    std::vector<std::string> notifications;  // Rendered on_error notify messages
    bool dryRun = false;

    /**
     * Console rendering: status line, duration, step-by-step outcome, error
     */
    std::string formatted(bool verbose = false) const;
};

/**
 * Result of validating a workflow. Errors block execution, warnings do not.
 */
struct WorkflowValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    std::string formatted() const;
};

inline bool operator==(const WorkflowValidationResult& a, const WorkflowValidationResult& b) {
    return a.valid == b.valid && a.errors == b.errors && a.warnings == b.warnings;
}

inline bool operator!=(const WorkflowValidationResult& a, const WorkflowValidationResult& b) {
    return !(a == b);
}

} // namespace workflow
} // namespace sysflow
