#pragma once

#include <cstddef>

#include "lstree/tree.h"

namespace lstree {

struct TreeSummary {
    std::size_t total_files = 0;
    std::size_t total_folders = 0;
    std::size_t skipped_by_ignore = 0;
    std::size_t skipped_by_size = 0;

    bool has_skips() const noexcept { return skipped_by_ignore > 0 || skipped_by_size > 0; }
};

// Counts every node; the root folder is included in total_folders.
TreeSummary summarize(const TreeNode& tree);

} // namespace lstree
