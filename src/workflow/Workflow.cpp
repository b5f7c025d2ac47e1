#include "workflow/Workflow.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sysflow {
namespace workflow {

namespace {

std::string seconds(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << "s";
    return oss.str();
}

} // namespace

std::string WorkflowTrigger::label() const {
    if (schedule) {
        return "schedule(" + *schedule + ")";
    }
    if (manual.value_or(false)) {
        return "manual";
    }
    return event.value_or("");
}

WorkflowStepResult WorkflowStepResult::skippedStep(const std::string& name) {
    WorkflowStepResult result;
    result.name = name;
    result.success = true;
    result.exitCode = 0;
    result.duration = 0.0;
    result.skipped = true;
    return result;
}

std::string WorkflowResult::formatted(bool verbose) const {
    std::ostringstream out;
    auto executed = std::count_if(steps.begin(), steps.end(),
                                  [](const WorkflowStepResult& s) { return !s.skipped; });

    out << "Workflow: " << workflow << (dryRun ? " (dry run)" : "") << "\n";
    out << "Status: " << (success ? "SUCCESS" : "FAILED") << "\n";
    out << "Duration: " << seconds(totalDuration) << "\n";
    out << "Steps: " << executed << "/" << steps.size() << "\n";

    if (verbose || !success) {
        out << "\nStep Details:\n";
        for (const auto& step : steps) {
            const char* status = step.skipped ? "SKIPPED" : (step.success ? "OK" : "FAILED");
            out << "  - " << step.name << ": " << status;
            if (!step.skipped) {
                out << " (" << seconds(step.duration) << ")";
                if (step.attempts > 1) {
                    out << " after " << step.attempts << " attempts";
                }
            }
            out << "\n";
            if (verbose && !step.stdOut.empty()) {
                out << "    stdout: " << step.stdOut.substr(0, 200) << "\n";
            }
            if (!step.success && !step.stdErr.empty()) {
                out << "    stderr: " << step.stdErr << "\n";
            }
        }
    }

    if (!notifications.empty()) {
        out << "\nNotifications:\n";
        for (const auto& message : notifications) {
            out << "  " << message << "\n";
        }
    }

    if (error) {
        out << "\nError: " << *error << "\n";
    }

    return out.str();
}

std::string WorkflowValidationResult::formatted() const {
    std::ostringstream out;
    if (valid) {
        out << "Workflow is valid\n";
    } else {
        out << "Workflow has errors:\n";
        for (const auto& error : errors) {
            out << "  ERROR: " << error << "\n";
        }
    }
    if (!warnings.empty()) {
        out << "Warnings:\n";
        for (const auto& warning : warnings) {
            out << "  WARN: " << warning << "\n";
        }
    }
    return out.str();
}

} // namespace workflow
} // namespace sysflow
