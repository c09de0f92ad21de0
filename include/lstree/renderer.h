#pragma once

#include <iosfwd>
#include <string>

#include "lstree/config.h"
#include "lstree/summary.h"
#include "lstree/theme.h"
#include "lstree/tree.h"

namespace lstree {

class Renderer {
public:
    Renderer(const Config::Options& options, std::ostream& output);

    void render(const TreeNode& tree);
    void render_summary(const TreeSummary& summary);

private:
    void render_node(const TreeNode& node, const std::string& prefix, bool last, bool root);
    std::string node_label(const TreeNode& node) const;

    const Config::Options& options_;
    std::ostream& out_;
    Theme theme_;
};

} // namespace lstree
