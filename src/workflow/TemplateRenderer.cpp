#include "workflow/TemplateRenderer.hpp"
#include "workflow/ExecutionContext.hpp"
#include "workflow/WorkflowError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace sysflow {
namespace workflow {

namespace {

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) ++start;
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(start, end - start);
}

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t characterCount(const std::string& str) {
    return static_cast<size_t>(std::count_if(str.begin(), str.end(), [](char c) {
        return !isContinuationByte(c);
    }));
}

std::string firstCharacter(const std::string& str) {
    if (str.empty()) return "";
    size_t end = 1;
    while (end < str.size() && isContinuationByte(str[end])) ++end;
    return str.substr(0, end);
}

std::string lastCharacter(const std::string& str) {
    if (str.empty()) return "";
    size_t begin = str.size() - 1;
    while (begin > 0 && isContinuationByte(str[begin])) --begin;
    return str.substr(begin);
}

// Discarded (not thrown) when the value is not a JSON document
nlohmann::json parseJson(const std::string& value) {
    return nlohmann::json::parse(value, nullptr, false);
}

std::string elementText(const nlohmann::json& element) {
    if (element.is_string()) {
        return element.get<std::string>();
    }
    return element.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

bool TemplateRenderer::isValidName(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    return std::all_of(name.begin() + 1, name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

bool TemplateRenderer::isKnownFilter(const std::string& filter) {
    return filter == "upper" || filter == "lower" || filter == "trim" ||
           filter == "length" || filter == "count" || filter == "first" ||
           filter == "last" || filter == "json";
}

std::string TemplateRenderer::applyFilter(const std::string& filter, const std::string& value) {
    if (filter.empty()) {
        return value;
    }
    if (filter == "upper" || filter == "lower") {
        std::string result = value;
        bool upper = filter == "upper";
        std::transform(result.begin(), result.end(), result.begin(), [upper](unsigned char c) {
            return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
        });
        return result;
    }
    if (filter == "trim") {
        return trim(value);
    }
    if (filter == "length" || filter == "count") {
        auto parsed = parseJson(value);
        if (parsed.is_array()) {
            return std::to_string(parsed.size());
        }
        return std::to_string(characterCount(value));
    }
    if (filter == "first" || filter == "last") {
        bool first = filter == "first";
        auto parsed = parseJson(value);
        if (parsed.is_array()) {
            if (parsed.empty()) return "";
            return elementText(first ? parsed.front() : parsed.back());
        }
        return first ? firstCharacter(value) : lastCharacter(value);
    }
    if (filter == "json") {
        auto parsed = parseJson(value);
        if (parsed.is_discarded()) {
            return value;
        }
        return parsed.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    throw TemplateError(filter, "unknown filter");
}

std::vector<Placeholder> TemplateRenderer::scan(const std::string& text) {
    std::vector<Placeholder> placeholders;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t dollar = text.find("${", pos);
        if (dollar == std::string::npos) break;

        size_t close = text.find('}', dollar + 2);
        if (close == std::string::npos) {
            throw TemplateError(text.substr(dollar), "unterminated placeholder");
        }

        std::string body = text.substr(dollar + 2, close - dollar - 2);
        std::string raw = text.substr(dollar, close - dollar + 1);
        if (body.find('{') != std::string::npos) {
            throw TemplateError(raw, "nested placeholders are not supported");
        }

        Placeholder placeholder;
        placeholder.begin = dollar;
        placeholder.end = close + 1;

        auto bar = body.find('|');
        if (bar == std::string::npos) {
            placeholder.name = trim(body);
        } else {
            placeholder.name = trim(body.substr(0, bar));
            placeholder.filter = trim(body.substr(bar + 1));
            if (!isKnownFilter(placeholder.filter)) {
                throw TemplateError(raw, "unknown filter '" + placeholder.filter + "'");
            }
        }

        if (placeholder.name.empty()) {
            throw TemplateError(raw, "empty variable name");
        }
        if (!isValidName(placeholder.name)) {
            throw TemplateError(raw, "invalid variable name '" + placeholder.name + "'");
        }

        placeholders.push_back(std::move(placeholder));
        pos = close + 1;
    }

    return placeholders;
}

std::vector<std::string> TemplateRenderer::references(const std::string& text) {
    std::vector<std::string> names;
    for (const auto& placeholder : scan(text)) {
        if (std::find(names.begin(), names.end(), placeholder.name) == names.end()) {
            names.push_back(placeholder.name);
        }
    }
    return names;
}

std::string TemplateRenderer::render(const std::string& text, const Resolver& resolve) {
    auto placeholders = scan(text);
    if (placeholders.empty()) {
        return text;
    }

    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    for (const auto& placeholder : placeholders) {
        result.append(text, pos, placeholder.begin - pos);
        result += applyFilter(placeholder.filter, resolve(placeholder.name));
        pos = placeholder.end;
    }
    result.append(text, pos, std::string::npos);
    return result;
}

std::string TemplateRenderer::render(const std::string& text, const ExecutionContext& context) {
    return render(text, [&context](const std::string& name) {
        return context.lookup(name);
    });
}

} // namespace workflow
} // namespace sysflow
