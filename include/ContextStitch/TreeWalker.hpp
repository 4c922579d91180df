// =================================================================
// include/ContextStitch/TreeWalker.hpp
// =================================================================
// Header for deterministic directory traversal with ignore pruning.

#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace ContextStitch {

class IgnoreResolver;

/**
 * @brief Kind of filesystem node seen during a walk
 */
enum class EntryKind {
    File,
    Directory,
    Symlink,
    Other
};

/**
 * @brief One node visited by the walker
 */
struct WalkEntry {
    std::filesystem::path absolute_path;
    std::string relative_path;
    std::string name;
    EntryKind kind = EntryKind::Other;
    bool target_is_directory = false;   ///< For symlinks: what the link points at
    bool target_is_regular = false;
};

/**
 * @brief Tree of surviving files and directories, used for the tree view
 */
struct TreeNode {
    std::string name;
    std::string relative_path;
    EntryKind kind = EntryKind::Directory;
    std::string link_target;    ///< Set for symlinks, followed or not
    bool cyclic = false;        ///< Symlink back into a directory being walked
    std::vector<TreeNode> children;

    bool isDirectory() const { return kind == EntryKind::Directory; }
};

/**
 * @brief An entry that could not be read or was refused
 */
struct SkippedEntry {
    std::string relative_path;
    std::string reason;
};

/**
 * @brief Everything produced by one walk
 */
struct WalkResult {
    std::vector<std::string> candidates;   ///< Relative file paths in traversal order
    TreeNode root;
    std::vector<SkippedEntry> skipped;

    size_t directories_visited = 0;
    size_t directories_pruned = 0;
    size_t files_ignored = 0;
    size_t hidden_skipped = 0;
    size_t symlink_cycles = 0;
};

/**
 * @brief Walks a root directory depth-first in a reproducible order
 *
 * Children of each directory are visited in ascending byte order of their
 * names. Hidden entries are dropped before ignore rules are consulted and
 * ignored directories are never opened. When following symlinks, the
 * canonical identities of the directories on the current path are kept so
 * that a link back into one of them becomes a leaf instead of a loop.
 *
 * Errors on individual entries are collected in WalkResult::skipped; a walk
 * never throws for them.
 */
class TreeWalker {
public:
    /**
     * @brief Construct a walker
     * @param root_path Directory to walk
     * @param resolver Ignore decisions; must outlive the walker
     */
    TreeWalker(const std::string& root_path, const IgnoreResolver& resolver);

    void setIncludeHidden(bool include_hidden);
    void setFollowSymlinks(bool follow_symlinks);

    /**
     * @brief Walk the tree
     * @return Candidates, tree shape and skipped entries
     */
    WalkResult walk() const;

private:
    std::filesystem::path m_root_path;
    const IgnoreResolver& m_resolver;
    bool m_include_hidden;
    bool m_follow_symlinks;

    void walkDirectory(const std::filesystem::path& directory,
                       const std::string& relative_dir,
                       TreeNode& node,
                       WalkResult& result,
                       std::unordered_set<std::string>& open_directories) const;

    /**
     * @brief Stat one directory entry without following it
     * @return false if the entry could not be examined
     */
    bool describeEntry(const std::filesystem::directory_entry& entry,
                       const std::string& relative_dir,
                       WalkEntry& out,
                       std::string& error) const;

    static TreeNode makeLeaf(const WalkEntry& entry);
};

} // namespace ContextStitch
