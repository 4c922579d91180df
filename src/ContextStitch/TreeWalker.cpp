// =================================================================
// src/ContextStitch/TreeWalker.cpp
// =================================================================
// Implementation for deterministic directory traversal.

#include "ContextStitch/TreeWalker.hpp"
#include "ContextStitch/IgnoreResolver.hpp"
#include "ContextStitch/Logger.hpp"
#include <algorithm>

namespace ContextStitch {

namespace fs = std::filesystem;

TreeWalker::TreeWalker(const std::string& root_path, const IgnoreResolver& resolver)
    : m_root_path(fs::absolute(root_path).lexically_normal()),
      m_resolver(resolver),
      m_include_hidden(false),
      m_follow_symlinks(false)
{
}

void TreeWalker::setIncludeHidden(bool include_hidden) {
    m_include_hidden = include_hidden;
}

void TreeWalker::setFollowSymlinks(bool follow_symlinks) {
    m_follow_symlinks = follow_symlinks;
}

WalkResult TreeWalker::walk() const {
    WalkResult result;

    fs::path root = m_root_path;
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    result.root.name = root.filename().string();
    result.root.kind = EntryKind::Directory;

    std::unordered_set<std::string> open_directories;
    std::error_code ec;
    fs::path canonical_root = fs::canonical(root, ec);
    if (ec) {
        result.skipped.push_back({".", "cannot resolve root: " + ec.message()});
        return result;
    }

    open_directories.insert(canonical_root.string());
    result.directories_visited++;
    walkDirectory(root, "", result.root, result, open_directories);

    Logger::getInstance().logWalkSummary(result.candidates.size(), result.directories_visited,
                                         result.directories_pruned, result.skipped.size());
    return result;
}

void TreeWalker::walkDirectory(const fs::path& directory,
                               const std::string& relative_dir,
                               TreeNode& node,
                               WalkResult& result,
                               std::unordered_set<std::string>& open_directories) const {
    const std::string display_dir = relative_dir.empty() ? "." : relative_dir;

    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    const fs::directory_iterator end;
    while (!ec && it != end) {
        entries.push_back(*it);
        it.increment(ec);
    }
    if (ec) {
        // Keep whatever was listed before the failure
        LOG_WARNING("TreeWalker", "Cannot list directory " + display_dir, ec.message());
        result.skipped.push_back({display_dir, "cannot list directory: " + ec.message()});
    }

    // Directory order from the OS is arbitrary
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& dir_entry : entries) {
        const std::string name = dir_entry.path().filename().string();

        if (!m_include_hidden && !name.empty() && name[0] == '.') {
            result.hidden_skipped++;
            continue;
        }

        WalkEntry entry;
        std::string error;
        if (!describeEntry(dir_entry, relative_dir, entry, error)) {
            const std::string relative = relative_dir.empty() ? name : relative_dir + "/" + name;
            LOG_WARNING("TreeWalker", "Cannot stat " + relative, error);
            result.skipped.push_back({relative, error});
            continue;
        }

        // An unfollowed link is a leaf, so directory-only rules do not apply to it
        const bool is_directory = entry.kind == EntryKind::Directory ||
                                  (entry.kind == EntryKind::Symlink && m_follow_symlinks &&
                                   entry.target_is_directory);

        IgnoreDecision decision = m_resolver.decide(entry.relative_path, is_directory);
        if (decision.ignored) {
            if (is_directory) {
                result.directories_pruned++;
            } else {
                result.files_ignored++;
            }
            if (decision.rule != nullptr) {
                LOG_DEBUG("TreeWalker", "Ignored " + entry.relative_path,
                          "rule '" + decision.rule->getPattern() + "' from " + getLayerName(decision.layer));
            }
            continue;
        }

        if (entry.kind == EntryKind::Symlink && !m_follow_symlinks) {
            node.children.push_back(makeLeaf(entry));
            continue;
        }

        if (is_directory) {
            std::error_code canon_ec;
            fs::path identity = fs::canonical(entry.absolute_path, canon_ec);
            if (canon_ec) {
                result.skipped.push_back({entry.relative_path, "cannot resolve directory: " + canon_ec.message()});
                continue;
            }

            TreeNode child = makeLeaf(entry);
            child.kind = EntryKind::Directory;

            if (open_directories.count(identity.string()) > 0) {
                child.cyclic = true;
                result.symlink_cycles++;
                LOG_DEBUG("TreeWalker", "Not descending into symlink cycle " + entry.relative_path,
                          identity.string());
                node.children.push_back(std::move(child));
                continue;
            }

            open_directories.insert(identity.string());
            result.directories_visited++;
            walkDirectory(entry.absolute_path, entry.relative_path, child, result, open_directories);
            open_directories.erase(identity.string());

            node.children.push_back(std::move(child));
            continue;
        }

        if (entry.kind == EntryKind::File ||
            (entry.kind == EntryKind::Symlink && entry.target_is_regular)) {
            result.candidates.push_back(entry.relative_path);
            node.children.push_back(makeLeaf(entry));
            continue;
        }

        // FIFOs, sockets, devices and dangling links are never read
        result.skipped.push_back({entry.relative_path,
                                  entry.kind == EntryKind::Symlink ? "dangling symlink" : "not a regular file"});
    }
}

bool TreeWalker::describeEntry(const fs::directory_entry& dir_entry,
                               const std::string& relative_dir,
                               WalkEntry& out,
                               std::string& error) const {
    out.absolute_path = dir_entry.path();
    out.name = dir_entry.path().filename().string();
    out.relative_path = relative_dir.empty() ? out.name : relative_dir + "/" + out.name;

    std::error_code ec;
    fs::file_status own_status = dir_entry.symlink_status(ec);
    if (ec) {
        error = "cannot stat: " + ec.message();
        return false;
    }

    if (fs::is_symlink(own_status)) {
        out.kind = EntryKind::Symlink;
        std::error_code target_ec;
        fs::file_status target_status = dir_entry.status(target_ec);
        if (!target_ec) {
            out.target_is_directory = fs::is_directory(target_status);
            out.target_is_regular = fs::is_regular_file(target_status);
        }
    } else if (fs::is_directory(own_status)) {
        out.kind = EntryKind::Directory;
    } else if (fs::is_regular_file(own_status)) {
        out.kind = EntryKind::File;
    } else {
        out.kind = EntryKind::Other;
    }

    return true;
}

TreeNode TreeWalker::makeLeaf(const WalkEntry& entry) {
    TreeNode leaf;
    leaf.name = entry.name;
    leaf.relative_path = entry.relative_path;
    leaf.kind = entry.kind;

    if (entry.kind == EntryKind::Symlink) {
        std::error_code ec;
        fs::path target = fs::read_symlink(entry.absolute_path, ec);
        if (!ec) {
            leaf.link_target = target.string();
        }
    }
    return leaf;
}

} // namespace ContextStitch
