#include "lstree/renderer.h"

#include <cctype>
#include <format>
#include <ostream>
#include <string_view>

namespace lstree {
namespace {

constexpr std::string_view kBranch = "├── ";
constexpr std::string_view kLastBranch = "└── ";
constexpr std::string_view kPipe = "│   ";
constexpr std::string_view kSpace = "    ";

// Control characters in file names would corrupt the terminal.
std::string sanitize_name(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        if (std::iscntrl(ch) && ch != '\t') {
            result.push_back('?');
        } else {
            result.push_back(static_cast<char>(ch));
        }
    }
    return result;
}

} // namespace

Renderer::Renderer(const Config::Options& options, std::ostream& output)
    : options_{options}, out_{output}, theme_{options} {}

void Renderer::render(const TreeNode& tree) {
    render_node(tree, {}, true, true);
}

std::string Renderer::node_label(const TreeNode& node) const {
    auto label = theme_.colorize(node, sanitize_name(theme_.label_for(node)));
    auto icon = theme_.icon_for(node);
    if (icon.empty()) {
        return label;
    }
    return icon + ' ' + label;
}

void Renderer::render_node(const TreeNode& node, const std::string& prefix, bool last, bool root) {
    if (!root) {
        out_ << prefix << (last ? kLastBranch : kBranch);
    }
    out_ << node_label(node) << '\n';

    if (!node.children) {
        return;
    }

    const std::string child_prefix = root ? std::string{} : prefix + std::string{last ? kSpace : kPipe};
    const auto& children = *node.children;
    for (std::size_t index = 0; index < children.size(); ++index) {
        render_node(children[index], child_prefix, index + 1 == children.size(), false);
    }
}

void Renderer::render_summary(const TreeSummary& summary) {
    out_ << '\n' << theme_.emphasize("heading", "Summary:") << '\n';
    out_ << "Total folders: " << theme_.emphasize("folders", std::to_string(summary.total_folders)) << '\n';
    out_ << "Total files: " << theme_.emphasize("files", std::to_string(summary.total_files)) << '\n';
    if (summary.has_skips()) {
        out_ << theme_.emphasize("warning", std::format("Skipped folders: {} (gitignore), {} (size)",
                                                        summary.skipped_by_ignore, summary.skipped_by_size))
             << '\n';
    }
}

} // namespace lstree
