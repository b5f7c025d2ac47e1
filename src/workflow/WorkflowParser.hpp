#pragma once

#include "workflow/Workflow.hpp"
#include <string>

namespace sysflow {
namespace workflow {

/**
 * YAML -> Workflow decoding.
 *
 * Purely syntactic: conditions and templates are left untouched for the
 * validator. Any structural problem throws ParseError, no partial
 * Workflow is ever returned.
 *
 * Document format:
 *   name: string               (required)
 *   description/version/author: string
 *   triggers: {schedule, manual, event} or a list of them
 *   env: {KEY: value}
 *   steps:                     (required, non-empty)
 *     - name, run (required), shell, output, when,
 *       timeout, continue_on_error, retries, retry_delay
 *   on_error:
 *     - notify, run
 */
class WorkflowParser {
public:
    /**
     * Decode a YAML document
     */
    static Workflow parse(const std::string& text);

    /**
     * Read and decode a file. Throws FileNotFoundError when it does not exist.
     */
    static Workflow load(const std::string& path);

    /**
     * Expand a leading "~" to $HOME
     */
    static std::string expandPath(const std::string& path);
};

} // namespace workflow
} // namespace sysflow
