#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include "lstree/fs.h"
#include "lstree/ignore.h"

namespace lstree {

struct TreeNode {
    enum class Kind {
        File,
        Folder
    };

    enum class SkipReason {
        None,
        IgnoredByRule,
        TooManyEntries
    };

    std::string name;
    std::filesystem::path path;
    Kind kind = Kind::File;
    SkipReason skip = SkipReason::None;
    std::uintmax_t size = 0;
    // Absent for files and for folders that were not descended into.
    std::optional<std::vector<TreeNode>> children;

    bool is_folder() const noexcept { return kind == Kind::Folder; }

    static TreeNode file(std::string name, std::filesystem::path path, std::uintmax_t size);
    static TreeNode folder(std::string name, std::filesystem::path path, std::vector<TreeNode> children);
    static TreeNode skipped_folder(std::string name, std::filesystem::path path, SkipReason reason);
};

// Folders before files, then byte-wise by name.
bool folders_first_by_name(const TreeNode& lhs, const TreeNode& rhs);

struct BuildOptions {
    // Collapse a directory once its visible entry count exceeds this.
    std::optional<std::size_t> max_leaf;
    // Extra patterns applied at the scan root only.
    std::vector<std::string> ignore_patterns;
    // Checked before each directory visit.
    std::stop_token stop;
};

class ScanCancelled : public std::runtime_error {
public:
    explicit ScanCancelled(const std::filesystem::path& at)
        : std::runtime_error{"scan cancelled at " + at.string()} {}
};

class TreeBuilder {
public:
    explicit TreeBuilder(BuildOptions options);

    // Entry point: resolves root to a normalized absolute path and walks it.
    TreeNode build(const std::filesystem::path& root) const;

    // One recursion step; stack holds the levels declared above path.
    TreeNode build(const std::filesystem::path& path, const IgnoreRuleStack& stack) const;

    const BuildOptions& options() const noexcept { return options_; }

private:
    struct Candidate {
        ScannedEntry entry;
        bool excluded = false;
    };

    BuildOptions options_;
    DirectoryScanner scanner_;
};

std::filesystem::path normalize_root(const std::filesystem::path& root);

} // namespace lstree
