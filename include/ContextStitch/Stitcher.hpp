// =================================================================
// include/ContextStitch/Stitcher.hpp
// =================================================================
// Pipeline facade: resolve ignores, walk the root, classify candidates.

#pragma once

#include "ContextStitch/FileClassifier.hpp"
#include "ContextStitch/IgnoreResolver.hpp"
#include "ContextStitch/StitchConfig.hpp"
#include "ContextStitch/TreeWalker.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace ContextStitch {

/**
 * @brief Walk result plus one verdict per candidate, in traversal order
 */
struct StitchResult {
    std::filesystem::path root_path;
    WalkResult walk;
    std::vector<FileVerdict> verdicts;

    size_t countStatus(FileStatus status) const;
    size_t countFallbackDecoded() const;
};

/**
 * @brief Runs the selection pipeline for one configuration
 *
 * The configuration is validated and the ignore resolver assembled once, in
 * the constructor, so every ConfigurationError surfaces before any file is
 * touched. run() can be called repeatedly; each call walks the tree anew.
 */
class Stitcher {
public:
    /**
     * @param config Settings for the run
     * @throws ConfigurationError if the configuration is invalid
     */
    explicit Stitcher(const StitchConfig& config);

    /**
     * @brief Walk the root and classify every candidate
     *
     * With jobs > 1 the candidates are split into contiguous ranges that are
     * classified concurrently; each verdict is stored at its candidate's index.
     */
    StitchResult run() const;

private:
    StitchConfig m_config;
    std::filesystem::path m_root_path;
    IgnoreResolver m_resolver;
    FileClassifier m_classifier;

    std::vector<FileVerdict> classifyAll(const std::vector<std::string>& candidates) const;

    static const StitchConfig& validated(const StitchConfig& config);
    static std::filesystem::path resolveRoot(const std::string& root);
};

} // namespace ContextStitch
