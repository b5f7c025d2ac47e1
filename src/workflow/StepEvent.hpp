#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace sysflow {
namespace workflow {

/**
 * Status of a step during a run
 */
enum class StepStatus {
    Started,    // Step began executing
    Completed,  // Step finished successfully
    Failed,     // Step failed (after retries)
    Skipped     // Guard evaluated false
};

/**
 * Event emitted while the engine walks the steps, for live progress output
 */
struct StepEvent {
    std::string workflow;
    std::string step;
    size_t index = 0;            // Zero-based position in the workflow
    StepStatus status;
    double duration = 0.0;       // Seconds (only for Completed/Failed)
    int exitCode = 0;            // Only for Completed/Failed
    std::string errorMessage;    // Only for Failed

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["workflow"] = workflow;
        j["step"] = step;
        j["index"] = index;

        switch (status) {
            case StepStatus::Started:
                j["status"] = "started";
                break;
            case StepStatus::Completed:
                j["status"] = "completed";
                j["duration"] = duration;
                j["exit_code"] = exitCode;
                break;
            case StepStatus::Failed:
                j["status"] = "failed";
                j["duration"] = duration;
                j["exit_code"] = exitCode;
                j["error_message"] = errorMessage;
                break;
            case StepStatus::Skipped:
                j["status"] = "skipped";
                break;
        }

        return j;
    }
};

/**
 * Callback type for step events
 */
using StepCallback = std::function<void(const StepEvent&)>;

} // namespace workflow
} // namespace sysflow
