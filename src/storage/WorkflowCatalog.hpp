#pragma once

#include "workflow/Workflow.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sysflow {
namespace storage {

using WorkflowEntry = std::pair<std::string, workflow::Workflow>;  // (path, workflow)

/**
 * Directory of workflow files (*.yaml / *.yml)
 *
 * Usage:
 *   WorkflowCatalog catalog("~/.sysflow/workflows");
 *   for (const auto& [path, wf] : catalog.listWorkflows()) { ... }
 *   catalog.createWorkflow("backup", "Nightly backup");
 */
class WorkflowCatalog {
public:
    static constexpr const char* kDefaultDirectory = "~/.sysflow/workflows";

    explicit WorkflowCatalog(std::string defaultDirectory = kDefaultDirectory);

    /**
     * Load every workflow file in the directory (default directory when
     * omitted), sorted by workflow name then path.
     * A missing directory yields an empty list; unreadable or invalid files
     * are logged and skipped.
     */
    std::vector<WorkflowEntry> listWorkflows(const std::optional<std::string>& directory = std::nullopt) const;

    /**
     * Write a starter workflow and return its path.
     * Throws std::runtime_error if the file exists and force is false.
     */
    std::string createWorkflow(const std::string& name,
                               const std::optional<std::string>& description = std::nullopt,
                               const std::optional<std::string>& directory = std::nullopt,
                               bool force = false) const;

    /**
     * Resolved (tilde-expanded) default directory
     */
    std::string getDirectory() const;

    static bool isWorkflowFile(const std::string& path);

private:
    std::string m_defaultDirectory;
};

/**
 * Starter document for "sysflow new"
 */
class WorkflowTemplate {
public:
    /**
     * Lower-cased, spaces replaced by dashes
     */
    static std::string slug(const std::string& name);

    static std::string generate(const std::string& name,
                                const std::optional<std::string>& description = std::nullopt);
};

} // namespace storage
} // namespace sysflow
