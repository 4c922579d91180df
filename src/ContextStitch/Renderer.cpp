// =================================================================
// src/ContextStitch/Renderer.cpp
// =================================================================
// Implementation for Markdown, text and JSON rendering.

#include "ContextStitch/Renderer.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace ContextStitch {

namespace {

const std::string kRule(80, '=');
const std::string kThinRule(80, '-');

nlohmann::json treeToJson(const TreeNode& node) {
    nlohmann::json json_node;
    json_node["name"] = node.name;
    json_node["path"] = node.relative_path;

    switch (node.kind) {
        case EntryKind::Directory: json_node["type"] = "directory"; break;
        case EntryKind::File: json_node["type"] = "file"; break;
        case EntryKind::Symlink: json_node["type"] = "symlink"; break;
        default: json_node["type"] = "other"; break;
    }
    if (!node.link_target.empty()) {
        json_node["target"] = node.link_target;
    }
    if (node.cyclic) {
        json_node["cyclic"] = true;
    }

    if (node.isDirectory()) {
        json_node["children"] = nlohmann::json::array();
        for (const auto& child : node.children) {
            json_node["children"].push_back(treeToJson(child));
        }
    }
    return json_node;
}

void appendContent(std::ostringstream& out, const std::string& text) {
    out << text;
    if (text.empty() || text.back() != '\n') {
        out << '\n';
    }
}

} // namespace

Renderer::Renderer(OutputFormat format)
    : m_format(format),
      m_absolute_paths(false),
      m_timestamp(currentTimestamp())
{
}

void Renderer::setAbsolutePaths(bool absolute_paths) {
    m_absolute_paths = absolute_paths;
}

void Renderer::setTimestamp(const std::string& timestamp) {
    m_timestamp = timestamp;
}

std::string Renderer::render(const StitchResult& result) const {
    switch (m_format) {
        case OutputFormat::Text: return renderText(result);
        case OutputFormat::Json: return renderJson(result);
        case OutputFormat::Markdown:
        default: return renderMarkdown(result);
    }
}

std::string Renderer::renderMarkdown(const StitchResult& result) const {
    std::ostringstream out;

    out << "# ContextStitch Output\n\n";
    out << "- **Root**: `" << result.root_path.string() << "`\n";
    out << "- **Generated**: " << m_timestamp << "\n";
    out << "- **Files included**: " << result.countStatus(FileStatus::Included) << "\n\n";

    out << "## Folder Tree\n\n";
    out << "```text\n";
    for (const auto& line : renderTreeLines(result.walk.root)) {
        out << line << "\n";
    }
    out << "```\n\n";

    out << "## Files\n\n";
    for (const auto& verdict : result.verdicts) {
        if (!verdict.isIncluded()) {
            continue;
        }
        const std::string fence = chooseFence(verdict.text);
        out << "### `" << displayPath(result, verdict.relative_path) << "`\n\n";
        out << fence << getLanguageTag(verdict.relative_path) << "\n";
        appendContent(out, verdict.text);
        out << fence << "\n\n";
    }

    const size_t skipped_files = result.verdicts.size() - result.countStatus(FileStatus::Included);
    if (skipped_files > 0 || !result.walk.skipped.empty()) {
        out << "## Skipped\n\n";
        for (const auto& verdict : result.verdicts) {
            if (!verdict.isIncluded()) {
                out << "- `" << displayPath(result, verdict.relative_path) << "`: "
                    << getStatusName(verdict.status) << " (" << verdict.reason << ")\n";
            }
        }
        for (const auto& entry : result.walk.skipped) {
            out << "- `" << displayPath(result, entry.relative_path) << "`: " << entry.reason << "\n";
        }
        out << "\n";
    }

    return out.str();
}

std::string Renderer::renderText(const StitchResult& result) const {
    std::ostringstream out;

    out << "ContextStitch output\n";
    out << "Root: " << result.root_path.string() << "\n";
    out << "Generated: " << m_timestamp << "\n";
    out << kRule << "\n\n";

    out << "FOLDER TREE\n";
    out << kThinRule << "\n";
    for (const auto& line : renderTreeLines(result.walk.root)) {
        out << line << "\n";
    }
    out << "\n";

    out << "FILES\n";
    out << kThinRule << "\n";
    for (const auto& verdict : result.verdicts) {
        if (!verdict.isIncluded()) {
            continue;
        }
        const std::string path = displayPath(result, verdict.relative_path);
        out << "--- BEGIN FILE: " << path << " ---\n";
        appendContent(out, verdict.text);
        out << "--- END FILE: " << path << " ---\n\n";
    }

    const size_t skipped_files = result.verdicts.size() - result.countStatus(FileStatus::Included);
    if (skipped_files > 0 || !result.walk.skipped.empty()) {
        out << "SKIPPED\n";
        out << kThinRule << "\n";
        for (const auto& verdict : result.verdicts) {
            if (!verdict.isIncluded()) {
                out << displayPath(result, verdict.relative_path) << ": "
                    << getStatusName(verdict.status) << " (" << verdict.reason << ")\n";
            }
        }
        for (const auto& entry : result.walk.skipped) {
            out << displayPath(result, entry.relative_path) << ": " << entry.reason << "\n";
        }
    }

    return out.str();
}

std::string Renderer::renderJson(const StitchResult& result) const {
    nlohmann::json document;
    document["root"] = result.root_path.string();
    document["generated"] = m_timestamp;
    document["tree"] = treeToJson(result.walk.root);

    document["files"] = nlohmann::json::array();
    for (const auto& verdict : result.verdicts) {
        nlohmann::json file;
        file["path"] = displayPath(result, verdict.relative_path);
        file["status"] = getStatusName(verdict.status);
        file["size"] = verdict.size_bytes;
        if (verdict.isIncluded()) {
            file["encoding"] = verdict.encoding;
            file["fallback"] = verdict.used_fallback;
            file["content"] = verdict.text;
        } else {
            file["reason"] = verdict.reason;
        }
        document["files"].push_back(file);
    }

    document["skipped"] = nlohmann::json::array();
    for (const auto& entry : result.walk.skipped) {
        document["skipped"].push_back({{"path", displayPath(result, entry.relative_path)},
                                       {"reason", entry.reason}});
    }

    // File names are not guaranteed to be valid UTF-8
    return document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::string Renderer::displayPath(const StitchResult& result, const std::string& relative_path) const {
    if (!m_absolute_paths) {
        return relative_path;
    }
    if (relative_path.empty() || relative_path == ".") {
        return result.root_path.string();
    }
    return (result.root_path / relative_path).string();
}

std::vector<std::string> Renderer::renderTreeLines(const TreeNode& root) {
    std::vector<std::string> lines;
    lines.push_back(root.name + "/");
    appendTreeLines(root, "", lines);
    return lines;
}

void Renderer::appendTreeLines(const TreeNode& node, const std::string& prefix,
                               std::vector<std::string>& lines) {
    for (size_t i = 0; i < node.children.size(); ++i) {
        const TreeNode& child = node.children[i];
        const bool is_last = i + 1 == node.children.size();

        lines.push_back(prefix + (is_last ? "└── " : "├── ") + describeNode(child));
        if (child.isDirectory() && !child.children.empty()) {
            appendTreeLines(child, prefix + (is_last ? "    " : "│   "), lines);
        }
    }
}

std::string Renderer::describeNode(const TreeNode& node) {
    std::string label = node.name;
    if (node.isDirectory()) {
        label += "/";
    }
    if (!node.link_target.empty()) {
        label += " -> " + node.link_target;
    }
    if (node.cyclic) {
        label += " [cycle]";
    }
    return label;
}

std::string Renderer::getLanguageTag(const std::string& path) {
    static const std::unordered_map<std::string, std::string> languages = {
        {"py", "python"}, {"js", "javascript"}, {"ts", "typescript"}, {"tsx", "tsx"},
        {"jsx", "jsx"}, {"json", "json"}, {"yml", "yaml"}, {"yaml", "yaml"},
        {"toml", "toml"}, {"ini", "ini"}, {"cfg", "ini"}, {"md", "markdown"},
        {"sh", "bash"}, {"zsh", "bash"}, {"ps1", "powershell"}, {"rb", "ruby"},
        {"go", "go"}, {"rs", "rust"}, {"java", "java"}, {"kt", "kotlin"},
        {"c", "c"}, {"h", "c"}, {"cpp", "cpp"}, {"hpp", "cpp"},
        {"cs", "csharp"}, {"php", "php"}, {"sql", "sql"}, {"html", "html"},
        {"css", "css"}, {"vue", "vue"}, {"sv", "verilog"}
    };

    // Extension of the last path component; dotfiles have none
    const size_t slash = path.find_last_of('/');
    const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    const size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }

    std::string extension = name.substr(dot + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = languages.find(extension);
    return it == languages.end() ? "" : it->second;
}

std::string Renderer::chooseFence(const std::string& content) {
    size_t longest = 0;
    size_t run = 0;
    for (char c : content) {
        run = c == '`' ? run + 1 : 0;
        longest = std::max(longest, run);
    }
    return std::string(std::max<size_t>(3, longest + 1), '`');
}

std::string Renderer::currentTimestamp() {
    auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm local_tm{};
#if defined(_WIN32)
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace ContextStitch
