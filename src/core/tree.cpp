#include "lstree/tree.h"

#include <algorithm>
#include <system_error>
#include <utility>

#include "lstree/logger.h"

namespace lstree {
namespace {

std::string display_name(const std::filesystem::path& path) {
    auto name = path.filename().string();
    return name.empty() ? path.string() : name;
}

} // namespace

TreeNode TreeNode::file(std::string name, std::filesystem::path path, std::uintmax_t size) {
    TreeNode node;
    node.name = std::move(name);
    node.path = std::move(path);
    node.kind = Kind::File;
    node.size = size;
    return node;
}

TreeNode TreeNode::folder(std::string name, std::filesystem::path path, std::vector<TreeNode> children) {
    TreeNode node;
    node.name = std::move(name);
    node.path = std::move(path);
    node.kind = Kind::Folder;
    node.children = std::move(children);
    return node;
}

TreeNode TreeNode::skipped_folder(std::string name, std::filesystem::path path, SkipReason reason) {
    TreeNode node;
    node.name = std::move(name);
    node.path = std::move(path);
    node.kind = Kind::Folder;
    node.skip = reason;
    return node;
}

bool folders_first_by_name(const TreeNode& lhs, const TreeNode& rhs) {
    if (lhs.kind != rhs.kind) {
        return lhs.is_folder();
    }
    return lhs.name < rhs.name;
}

std::filesystem::path normalize_root(const std::filesystem::path& root) {
    std::error_code ec;
    auto resolved = std::filesystem::absolute(root, ec);
    if (ec) {
        Logger::instance().warn("cannot make {} absolute: {}", root.string(), ec.message());
        resolved = root;
    }
    resolved = resolved.lexically_normal();
    if (resolved.filename().empty() && resolved.has_relative_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

TreeBuilder::TreeBuilder(BuildOptions options)
    : options_{std::move(options)} {}

TreeNode TreeBuilder::build(const std::filesystem::path& root) const {
    const auto resolved = normalize_root(root);
    Logger::instance().info("building tree for {}", resolved.string());
    return build(resolved, IgnoreRuleStack{});
}

TreeNode TreeBuilder::build(const std::filesystem::path& path, const IgnoreRuleStack& stack) const {
    if (options_.stop.stop_requested()) {
        throw ScanCancelled{path};
    }

    auto name = display_name(path);
    const auto stat = scanner_.stat_path(path);
    if (!stat) {
        Logger::instance().warn("cannot stat {}, shown as empty file", path.string());
        return TreeNode::file(std::move(name), path, 0);
    }
    if (stat->is_symlink) {
        Logger::instance().debug("{} is a symlink, not followed", path.string());
        return TreeNode::file(std::move(name), path, 0);
    }
    if (!stat->is_directory) {
        return TreeNode::file(std::move(name), path, stat->size);
    }

    const auto level = stack.pushed(declare_level(path, stack.empty(), options_.ignore_patterns), path);

    std::vector<Candidate> candidates;
    std::size_t visible = 0;
    for (auto& entry : scanner_.scan(path)) {
        if (entry.is_symlink) {
            continue;
        }
        const bool excluded = level.excludes(entry.path, entry.is_directory);
        if (!excluded) {
            ++visible;
        }
        candidates.push_back(Candidate{std::move(entry), excluded});
    }

    if (options_.max_leaf && *options_.max_leaf > 0 && visible > *options_.max_leaf) {
        Logger::instance().debug("{}: {} visible entries exceed {}, collapsed", path.string(), visible,
                                 *options_.max_leaf);
        return TreeNode::skipped_folder(std::move(name), path, TreeNode::SkipReason::TooManyEntries);
    }

    std::vector<TreeNode> children;
    children.reserve(candidates.size());
    for (auto& candidate : candidates) {
        auto& entry = candidate.entry;
        if (candidate.excluded) {
            // ignored files carry nothing; ignored directories stay as placeholders
            if (entry.is_directory) {
                children.push_back(TreeNode::skipped_folder(std::move(entry.name), std::move(entry.path),
                                                            TreeNode::SkipReason::IgnoredByRule));
            }
            continue;
        }

        if (entry.is_directory) {
            children.push_back(build(entry.path, level));
        } else {
            children.push_back(TreeNode::file(std::move(entry.name), std::move(entry.path), entry.size));
        }
    }

    std::sort(children.begin(), children.end(), folders_first_by_name);
    return TreeNode::folder(std::move(name), path, std::move(children));
}

} // namespace lstree
