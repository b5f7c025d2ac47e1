#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace sysflow {
namespace workflow {

/**
 * Base for everything the workflow layer throws
 */
class WorkflowError : public std::runtime_error {
public:
    explicit WorkflowError(const std::string& message)
        : std::runtime_error(message) {}
};

class FileNotFoundError : public WorkflowError {
public:
    explicit FileNotFoundError(const std::string& path)
        : WorkflowError("Workflow file not found: " + path), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

class ParseError : public WorkflowError {
public:
    explicit ParseError(const std::string& message)
        : WorkflowError("Failed to parse workflow: " + message) {}
};

/**
 * Raised by callers that gate on validation; the validator itself never throws
 */
class ValidationError : public WorkflowError {
public:
    explicit ValidationError(std::vector<std::string> errors, std::vector<std::string> warnings = {})
        : WorkflowError("Workflow is invalid: " + (errors.empty() ? std::string("unknown error") : errors.front()))
        , m_errors(std::move(errors))
        , m_warnings(std::move(warnings)) {}

    const std::vector<std::string>& errors() const { return m_errors; }
    const std::vector<std::string>& warnings() const { return m_warnings; }

private:
    std::vector<std::string> m_errors;
    std::vector<std::string> m_warnings;
};

/**
 * A step that failed the workflow. The engine reports it as data through
 * WorkflowResult::error rather than throwing it.
 */
class StepFailedError : public WorkflowError {
public:
    StepFailedError(const std::string& step, int exitCode)
        : WorkflowError("Step '" + step + "' failed with exit code " + std::to_string(exitCode))
        , m_step(step), m_exitCode(exitCode) {}

    const std::string& step() const { return m_step; }
    int exitCode() const { return m_exitCode; }

private:
    std::string m_step;
    int m_exitCode;
};

class ConditionError : public WorkflowError {
public:
    ConditionError(const std::string& expression, const std::string& detail)
        : WorkflowError("Condition evaluation failed: " + expression + ": " + detail)
        , m_expression(expression), m_detail(detail) {}

    const std::string& expression() const { return m_expression; }
    const std::string& detail() const { return m_detail; }

private:
    std::string m_expression;
    std::string m_detail;
};

class TimeoutError : public WorkflowError {
public:
    explicit TimeoutError(const std::string& step)
        : WorkflowError("Step '" + step + "' timed out"), m_step(step) {}

    const std::string& step() const { return m_step; }

private:
    std::string m_step;
};

class TemplateError : public WorkflowError {
public:
    TemplateError(const std::string& text, const std::string& detail)
        : WorkflowError("Invalid template: " + text + ": " + detail)
        , m_text(text), m_detail(detail) {}

    const std::string& text() const { return m_text; }
    const std::string& detail() const { return m_detail; }

private:
    std::string m_text;
    std::string m_detail;
};

} // namespace workflow
} // namespace sysflow
