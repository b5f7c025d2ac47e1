#pragma once

#include "workflow/Workflow.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sysflow {
namespace workflow {

using json = nlohmann::json;

/**
 * JSON renderings of results for machine consumers (--json)
 *
 * Step result:
 *   {"name": "build", "success": true, "exit_code": 0, "stdout": "...",
 *    "stderr": "", "duration": 0.42, "skipped": false, "command": "make",
 *    "attempts": 1, "timed_out": false}
 *
 * Optional fields are omitted when absent.
 */
class WorkflowSerializer {
public:
    static json toJson(const WorkflowStepResult& step);
    static json toJson(const WorkflowResult& result);
    static json toJson(const WorkflowValidationResult& validation);

    /**
     * Listing entry: path, name, step count, description, version, triggers
     */
    static json summaryToJson(const std::string& path, const Workflow& workflow);

    /**
     * Human labels for each configured trigger
     */
    static std::vector<std::string> triggerLabels(const Workflow& workflow);

    /**
     * Dump for output. Invalid UTF-8 (e.g. raw bytes from a step's stdout)
     * is replaced with U+FFFD instead of throwing.
     */
    static std::string dump(const json& j, int indent = 2);

    static std::string toString(const WorkflowResult& result, int indent = 2);
};

} // namespace workflow
} // namespace sysflow
