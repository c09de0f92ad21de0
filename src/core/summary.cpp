#include "lstree/summary.h"

namespace lstree {
namespace {

void accumulate(const TreeNode& node, TreeSummary& summary) {
    if (node.is_folder()) {
        ++summary.total_folders;
        if (node.skip == TreeNode::SkipReason::IgnoredByRule) {
            ++summary.skipped_by_ignore;
        } else if (node.skip == TreeNode::SkipReason::TooManyEntries) {
            ++summary.skipped_by_size;
        }
    } else {
        ++summary.total_files;
    }

    if (node.children) {
        for (const auto& child : *node.children) {
            accumulate(child, summary);
        }
    }
}

} // namespace

TreeSummary summarize(const TreeNode& tree) {
    TreeSummary summary;
    accumulate(tree, summary);
    return summary;
}

} // namespace lstree
