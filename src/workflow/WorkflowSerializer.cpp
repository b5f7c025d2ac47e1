#include "workflow/WorkflowSerializer.hpp"

namespace sysflow {
namespace workflow {

json WorkflowSerializer::toJson(const WorkflowStepResult& step) {
    json j;
    j["name"] = step.name;
    j["success"] = step.success;
    j["exit_code"] = step.exitCode;
    j["stdout"] = step.stdOut;
    j["stderr"] = step.stdErr;
    j["duration"] = step.duration;
    j["skipped"] = step.skipped;
    if (!step.skipped) {
        j["command"] = step.command;
        j["attempts"] = step.attempts;
        j["timed_out"] = step.timedOut;
    }
    return j;
}

json WorkflowSerializer::toJson(const WorkflowResult& result) {
    json j;
    j["workflow"] = result.workflow;
    j["success"] = result.success;
    j["total_duration"] = result.totalDuration;
    j["dry_run"] = result.dryRun;

    json steps = json::array();
    for (const auto& step : result.steps) {
        steps.push_back(toJson(step));
    }
    j["steps"] = steps;

    if (result.error) {
        j["error"] = *result.error;
    }
    if (!result.notifications.empty()) {
        j["notifications"] = result.notifications;
    }
    return j;
}

json WorkflowSerializer::toJson(const WorkflowValidationResult& validation) {
    json j;
    j["valid"] = validation.valid;
    j["errors"] = validation.errors;
    j["warnings"] = validation.warnings;
    return j;
}

std::vector<std::string> WorkflowSerializer::triggerLabels(const Workflow& workflow) {
    std::vector<std::string> labels;
    for (const auto& trigger : workflow.triggers) {
        auto label = trigger.label();
        if (!label.empty()) {
            labels.push_back(label);
        }
    }
    return labels;
}

json WorkflowSerializer::summaryToJson(const std::string& path, const Workflow& workflow) {
    json j;
    j["path"] = path;
    j["name"] = workflow.name;
    j["steps"] = workflow.steps.size();
    if (workflow.description) {
        j["description"] = *workflow.description;
    }
    if (workflow.version) {
        j["version"] = *workflow.version;
    }
    if (workflow.author) {
        j["author"] = *workflow.author;
    }
    auto labels = triggerLabels(workflow);
    if (!labels.empty()) {
        j["triggers"] = labels;
    }
    return j;
}

std::string WorkflowSerializer::dump(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string WorkflowSerializer::toString(const WorkflowResult& result, int indent) {
    return dump(toJson(result), indent);
}

} // namespace workflow
} // namespace sysflow
