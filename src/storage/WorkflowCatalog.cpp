#include "storage/WorkflowCatalog.hpp"
#include "workflow/WorkflowError.hpp"
#include "workflow/WorkflowParser.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sysflow {
namespace storage {

using workflow::WorkflowParser;

// =============================================================================
// WorkflowCatalog
// =============================================================================

WorkflowCatalog::WorkflowCatalog(std::string defaultDirectory)
    : m_defaultDirectory(std::move(defaultDirectory))
{}

std::string WorkflowCatalog::getDirectory() const {
    return WorkflowParser::expandPath(m_defaultDirectory);
}

bool WorkflowCatalog::isWorkflowFile(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".yaml" || ext == ".yml";
}

std::vector<WorkflowEntry> WorkflowCatalog::listWorkflows(const std::optional<std::string>& directory) const {
    std::string searchDir = directory ? WorkflowParser::expandPath(*directory) : getDirectory();

    std::error_code ec;
    if (!fs::is_directory(searchDir, ec)) {
        LOG_DEBUG("Workflow directory does not exist: " + searchDir);
        return {};
    }

    std::vector<WorkflowEntry> entries;
    for (fs::directory_iterator it(searchDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || !isWorkflowFile(it->path().string())) {
            continue;
        }

        std::string path = it->path().string();
        try {
            entries.emplace_back(path, WorkflowParser::load(path));
        } catch (const workflow::WorkflowError& e) {
            LOG_WARN("Failed to load workflow '" + it->path().filename().string() + "': " + e.what());
        }
    }
    if (ec) {
        LOG_WARN("Error reading workflow directory " + searchDir + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const WorkflowEntry& a, const WorkflowEntry& b) {
        if (a.second.name != b.second.name) {
            return a.second.name < b.second.name;
        }
        return a.first < b.first;
    });

    std::map<std::string, std::string> firstPathByName;
    for (const auto& [path, wf] : entries) {
        auto [it, inserted] = firstPathByName.emplace(wf.name, path);
        if (!inserted) {
            LOG_WARN("Duplicate workflow name '" + wf.name + "' in " + path + " (also in " + it->second + ")");
        }
    }

    return entries;
}

std::string WorkflowCatalog::createWorkflow(const std::string& name,
                                            const std::optional<std::string>& description,
                                            const std::optional<std::string>& directory,
                                            bool force) const {
    if (name.empty()) {
        throw std::runtime_error("Workflow name must not be empty");
    }

    fs::path outputDir = directory ? WorkflowParser::expandPath(*directory) : getDirectory();
    fs::create_directories(outputDir);

    std::string filename = isWorkflowFile(name) ? name : WorkflowTemplate::slug(name) + ".yaml";
    fs::path outputPath = outputDir / filename;

    if (fs::exists(outputPath) && !force) {
        throw std::runtime_error("File already exists: " + outputPath.string() + " (use --force to overwrite)");
    }

    std::string baseName = isWorkflowFile(name) ? fs::path(name).stem().string() : name;
    std::ofstream file(outputPath, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write workflow file: " + outputPath.string());
    }
    file << WorkflowTemplate::generate(baseName, description);
    if (!file) {
        throw std::runtime_error("Failed writing workflow file: " + outputPath.string());
    }

    LOG_INFO("Created workflow " + outputPath.string());
    return outputPath.string();
}

// =============================================================================
// WorkflowTemplate
// =============================================================================

namespace {

// YAML double-quoted scalar
std::string quoted(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string result = "\"";
    for (char c : text) {
        unsigned char byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            result += '\\';
            result += c;
        } else if (c == '\n') {
            result += "\\n";
        } else if (c == '\t') {
            result += "\\t";
        } else if (byte < 0x20 || byte == 0x7F) {
            result += "\\x";
            result += hex[byte >> 4];
            result += hex[byte & 0x0F];
        } else {
            result += c;
        }
    }
    return result + "\"";
}

// Name as it appears inside the sample commands: no shell or placeholder syntax
std::string greetingName(const std::string& name) {
    std::string result;
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == ' ') {
            result += static_cast<char>(c);
        }
    }
    return result.empty() ? std::string("sysflow") : result;
}

} // namespace

std::string WorkflowTemplate::slug(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (unsigned char c : name) {
        result += c == ' ' ? '-' : static_cast<char>(std::tolower(c));
    }
    return result;
}

std::string WorkflowTemplate::generate(const std::string& name, const std::optional<std::string>& description) {
    std::string safeName = slug(name);
    std::ostringstream out;
    out << "name: " << quoted(safeName) << "\n"
        << "description: " << quoted(description.value_or("A sysflow workflow")) << "\n"
        << "version: \"1.0.0\"\n"
        << "\n"
        << "steps:\n"
        << "  - name: hello\n"
        << "    run: " << quoted("echo \"Hello from " + greetingName(safeName) + "!\"") << "\n"
        << "    output: greeting\n"
        << "\n"
        << "  - name: show-greeting\n"
        << "    run: 'echo \"Previous step said: ${greeting}\"'\n"
        << "    when: 'greeting != \"\"'\n"
        << "\n"
        << "# Workflow features (uncomment to use):\n"
        << "#\n"
        << "# Triggers (advisory):\n"
        << "#   triggers:\n"
        << "#     - schedule: \"0 9 * * *\"\n"
        << "#     - manual: true\n"
        << "#\n"
        << "# Environment variables:\n"
        << "#   env:\n"
        << "#     MY_VAR: \"value\"\n"
        << "#\n"
        << "# Conditional execution:\n"
        << "#   - name: conditional-step\n"
        << "#     run: echo \"Only runs when MY_VAR is set\"\n"
        << "#     when: 'MY_VAR != \"\" && !${SKIP}'\n"
        << "#\n"
        << "# Retries and timeout:\n"
        << "#   - name: retry-example\n"
        << "#     run: curl -f https://api.example.com/data\n"
        << "#     retries: 3\n"
        << "#     retry_delay: 5\n"
        << "#     timeout: 30\n"
        << "#\n"
        << "# Continue on error:\n"
        << "#   - name: optional-step\n"
        << "#     run: echo \"This might fail\"\n"
        << "#     continue_on_error: true\n"
        << "#\n"
        << "# Error handling:\n"
        << "#   on_error:\n"
        << "#     - notify: \"Workflow failed: ${error}\"\n"
        << "#     - run: echo \"${failed_step} failed\" >> /tmp/sysflow-failures.log\n";
    return out.str();
}

} // namespace storage
} // namespace sysflow
