// =================================================================
// include/ContextStitch/Renderer.hpp
// =================================================================
// Header for turning a stitch result into the output artifact.

#pragma once

#include "ContextStitch/StitchConfig.hpp"
#include "ContextStitch/Stitcher.hpp"
#include <string>
#include <vector>

namespace ContextStitch {

/**
 * @brief Renders the folder tree and included files as Markdown, text or JSON
 *
 * Rendering is a pure function of the StitchResult and the renderer's
 * settings. The timestamp is fixed at construction so that one run
 * produces one consistent artifact.
 */
class Renderer {
public:
    /**
     * @brief Construct a new Renderer
     * @param format Output format
     */
    explicit Renderer(OutputFormat format);

    /**
     * @brief Print absolute instead of root-relative paths in file headings
     */
    void setAbsolutePaths(bool absolute_paths);

    /**
     * @brief Override the "Generated" timestamp (tests use a fixed value)
     */
    void setTimestamp(const std::string& timestamp);

    const std::string& getTimestamp() const { return m_timestamp; }

    /**
     * @brief Render a complete artifact
     * @param result Output of Stitcher::run()
     * @return Artifact text, UTF-8
     */
    std::string render(const StitchResult& result) const;

    /**
     * @brief Draw a tree with box-drawing branches
     *
     * The first line is the root name followed by '/'. Directories end in
     * '/', symlinks show their target, and cycles are marked.
     */
    static std::vector<std::string> renderTreeLines(const TreeNode& root);

    /**
     * @brief Code fence language for a file name, empty if unknown
     */
    static std::string getLanguageTag(const std::string& path);

    /**
     * @brief Backtick fence long enough not to be closed by the content
     */
    static std::string chooseFence(const std::string& content);

    /**
     * @brief Local time as "YYYY-MM-DD HH:MM:SS"
     */
    static std::string currentTimestamp();

private:
    OutputFormat m_format;
    bool m_absolute_paths;
    std::string m_timestamp;

    std::string renderMarkdown(const StitchResult& result) const;
    std::string renderText(const StitchResult& result) const;
    std::string renderJson(const StitchResult& result) const;

    std::string displayPath(const StitchResult& result, const std::string& relative_path) const;

    static void appendTreeLines(const TreeNode& node, const std::string& prefix,
                                std::vector<std::string>& lines);
    static std::string describeNode(const TreeNode& node);
};

} // namespace ContextStitch
