#pragma once

#include "workflow/ConditionParser.hpp"
#include <functional>
#include <optional>
#include <string>

namespace sysflow {
namespace workflow {

class ExecutionContext;

/**
 * Evaluates "when" guards by walking the parsed tree.
 *
 * Unknown variables resolve to "". A bare operand is truthy when it is
 * non-empty and not "false" or "0" (case-insensitive).
 */
class ConditionEvaluator {
public:
    using Resolver = std::function<std::string(const std::string&)>;

    /**
     * Parse and evaluate against a context
     * Throws ConditionError when the expression is malformed
     */
    static bool evaluate(const std::string& expression, const ExecutionContext& context);

    /**
     * Evaluate an already parsed tree
     */
    static bool evaluate(const ConditionNode& node, const Resolver& resolve);

    /**
     * Syntax check only. Returns the problem, or nullopt when well-formed.
     */
    static std::optional<std::string> check(const std::string& expression);

    static bool isTruthy(const std::string& value);

private:
    static std::string valueOf(const ConditionNode& node, const Resolver& resolve);
};

} // namespace workflow
} // namespace sysflow
