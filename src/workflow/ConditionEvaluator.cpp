#include "workflow/ConditionEvaluator.hpp"
#include "workflow/ExecutionContext.hpp"
#include "workflow/WorkflowError.hpp"
#include <algorithm>
#include <cctype>

namespace sysflow {
namespace workflow {

bool ConditionEvaluator::isTruthy(const std::string& value) {
    if (value.empty()) return false;
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower != "false" && lower != "0";
}

std::string ConditionEvaluator::valueOf(const ConditionNode& node, const Resolver& resolve) {
    switch (node.type) {
        case ConditionNode::Type::Literal:
            return node.value;
        case ConditionNode::Type::VarRef:
            return resolve(node.value);
        default:
            return evaluate(node, resolve) ? "true" : "false";
    }
}

bool ConditionEvaluator::evaluate(const ConditionNode& node, const Resolver& resolve) {
    switch (node.type) {
        case ConditionNode::Type::Literal:
            if (node.isBoolean) {
                return node.value == "true";
            }
            return isTruthy(node.value);

        case ConditionNode::Type::VarRef:
            return isTruthy(resolve(node.value));

        case ConditionNode::Type::Eq:
            return valueOf(*node.left, resolve) == valueOf(*node.right, resolve);

        case ConditionNode::Type::Neq:
            return valueOf(*node.left, resolve) != valueOf(*node.right, resolve);

        case ConditionNode::Type::And:
            return evaluate(*node.left, resolve) && evaluate(*node.right, resolve);

        case ConditionNode::Type::Or:
            return evaluate(*node.left, resolve) || evaluate(*node.right, resolve);

        case ConditionNode::Type::Not:
            return !evaluate(*node.left, resolve);
    }
    return false;
}

bool ConditionEvaluator::evaluate(const std::string& expression, const ExecutionContext& context) {
    auto root = parseCondition(expression);
    return evaluate(*root, [&context](const std::string& name) {
        return context.lookup(name);
    });
}

std::optional<std::string> ConditionEvaluator::check(const std::string& expression) {
    try {
        parseCondition(expression);
    } catch (const ConditionError& e) {
        return e.detail();
    }
    return std::nullopt;
}

} // namespace workflow
} // namespace sysflow
