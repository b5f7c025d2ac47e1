#pragma once

#include <functional>
#include <string>
#include <vector>

namespace sysflow {
namespace workflow {

class ExecutionContext;

/**
 * A ${name} or ${name | filter} occurrence in a template
 */
struct Placeholder {
    std::string name;
    std::string filter;   // Empty when no filter
    size_t begin = 0;     // Offset of '$'
    size_t end = 0;       // One past the closing '}'
};

/**
 * One-pass ${name} substitution.
 *
 * Substituted values are never re-scanned, so a value containing "${x}"
 * is emitted literally. A '$' not followed by '{' is copied as-is, which
 * leaves shell syntax such as $HOME or $(cmd) to the shell.
 *
 * Supported filters: upper, lower, trim, length (alias count), first, last
 * and json. Values holding a JSON array are treated as lists by length,
 * first and last; json pretty-prints a JSON value and passes anything else
 * through unchanged.
 */
class TemplateRenderer {
public:
    using Resolver = std::function<std::string(const std::string&)>;

    /**
     * Render against a context (variables, then env, then "")
     * Throws TemplateError on a malformed placeholder
     */
    static std::string render(const std::string& text, const ExecutionContext& context);

    /**
     * Render with a custom resolver
     */
    static std::string render(const std::string& text, const Resolver& resolve);

    /**
     * All placeholders in order of appearance
     * Throws TemplateError on a malformed placeholder
     */
    static std::vector<Placeholder> scan(const std::string& text);

    /**
     * Distinct variable names referenced, in order of first appearance
     */
    static std::vector<std::string> references(const std::string& text);

    static bool isValidName(const std::string& name);
    static bool isKnownFilter(const std::string& filter);
    static std::string applyFilter(const std::string& filter, const std::string& value);
};

} // namespace workflow
} // namespace sysflow
