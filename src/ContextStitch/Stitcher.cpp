// =================================================================
// src/ContextStitch/Stitcher.cpp
// =================================================================
// Implementation for the selection pipeline.

#include "ContextStitch/Stitcher.hpp"
#include "ContextStitch/ConfigurationError.hpp"
#include "ContextStitch/Logger.hpp"
#include <algorithm>
#include <future>

namespace ContextStitch {

namespace fs = std::filesystem;

size_t StitchResult::countStatus(FileStatus status) const {
    return static_cast<size_t>(std::count_if(verdicts.begin(), verdicts.end(),
        [status](const FileVerdict& verdict) { return verdict.status == status; }));
}

size_t StitchResult::countFallbackDecoded() const {
    return static_cast<size_t>(std::count_if(verdicts.begin(), verdicts.end(),
        [](const FileVerdict& verdict) { return verdict.isIncluded() && verdict.used_fallback; }));
}

Stitcher::Stitcher(const StitchConfig& config)
    : m_config(validated(config)),
      m_root_path(resolveRoot(m_config.root)),
      m_resolver(IgnoreResolver::build(m_config.getIgnoreSources(m_root_path.string()),
                                       m_config.buildPresetRegistry())),
      m_classifier(m_config.max_file_size, m_config.getTextEncoding())
{
    LOG_DEBUG("Stitcher", "Resolver ready with " + std::to_string(m_resolver.getRuleCount()) + " rules",
              m_root_path.string());
}

StitchResult Stitcher::run() const {
    StitchResult result;
    result.root_path = m_root_path;

    TreeWalker walker(m_root_path.string(), m_resolver);
    walker.setIncludeHidden(m_config.include_hidden);
    walker.setFollowSymlinks(m_config.follow_symlinks);
    result.walk = walker.walk();

    result.verdicts = classifyAll(result.walk.candidates);

    Logger::getInstance().logClassificationSummary(
        result.countStatus(FileStatus::Included),
        result.countStatus(FileStatus::SkippedBinary),
        result.countStatus(FileStatus::SkippedOversize),
        result.countStatus(FileStatus::SkippedUnreadable),
        result.countFallbackDecoded());

    return result;
}

std::vector<FileVerdict> Stitcher::classifyAll(const std::vector<std::string>& candidates) const {
    std::vector<FileVerdict> verdicts(candidates.size());

    auto classifyRange = [this, &candidates, &verdicts](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            verdicts[i] = m_classifier.classify(m_root_path / candidates[i], candidates[i]);
        }
    };

    const size_t workers = std::min(m_config.jobs, candidates.size());
    if (workers <= 1) {
        classifyRange(0, candidates.size());
        return verdicts;
    }

    const size_t chunk = (candidates.size() + workers - 1) / workers;
    std::vector<std::future<void>> futures;
    for (size_t begin = 0; begin < candidates.size(); begin += chunk) {
        const size_t end = std::min(begin + chunk, candidates.size());
        futures.push_back(std::async(std::launch::async, classifyRange, begin, end));
    }

    for (auto& future : futures) {
        future.get();
    }

    LOG_DEBUG("Stitcher", "Classified " + std::to_string(candidates.size()) + " files on " +
              std::to_string(futures.size()) + " workers");
    return verdicts;
}

const StitchConfig& Stitcher::validated(const StitchConfig& config) {
    config.validate();
    return config;
}

fs::path Stitcher::resolveRoot(const std::string& root) {
    std::error_code ec;
    fs::path resolved = fs::canonical(root, ec);
    if (ec) {
        throw ConfigurationError("Cannot resolve root " + root + ": " + ec.message());
    }
    return resolved;
}

} // namespace ContextStitch
