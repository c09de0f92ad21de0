#include "lstree/theme.h"

namespace lstree {

namespace {
std::string to_utf8(const char8_t* text) {
    return std::string{reinterpret_cast<const char*>(text)};
}
} // namespace

Theme::Theme(const Config::Options& options)
    : options_{options} {
    load_default_icons();
    load_default_colors();
}

void Theme::load_default_icons() {
    icon_map_["folder"] = to_utf8(u8"\U0001F4C1");
    icon_map_["file"] = to_utf8(u8"\U0001F4C4");
    icon_map_["ignored"] = to_utf8(u8"\U0001F6AB");
    icon_map_["too_many"] = to_utf8(u8"\U0001F4DA");
}

void Theme::load_default_colors() {
    color_map_["folder"] = "\033[1m\033[34m";
    color_map_["file"] = "";
    color_map_["ignored"] = "\033[90m";
    color_map_["too_many"] = "\033[33m";
    color_map_["heading"] = "\033[1m";
    color_map_["folders"] = "\033[34m";
    color_map_["files"] = "\033[32m";
    color_map_["warning"] = "\033[33m";
}

std::string Theme::key_for(const TreeNode& node) {
    switch (node.skip) {
        case TreeNode::SkipReason::IgnoredByRule:
            return "ignored";
        case TreeNode::SkipReason::TooManyEntries:
            return "too_many";
        case TreeNode::SkipReason::None:
            break;
    }
    return node.is_folder() ? "folder" : "file";
}

std::string Theme::icon_for(const TreeNode& node) const {
    if (!options_.icons_enabled) {
        return {};
    }
    auto it = icon_map_.find(key_for(node));
    return it != icon_map_.end() ? it->second : std::string{};
}

std::string Theme::label_for(const TreeNode& node) const {
    switch (node.skip) {
        case TreeNode::SkipReason::IgnoredByRule:
            return node.name + " (ignored)";
        case TreeNode::SkipReason::TooManyEntries:
            return node.name + " (too many files)";
        case TreeNode::SkipReason::None:
            break;
    }
    return node.name;
}

std::string Theme::colorize(const TreeNode& node, std::string_view text) const {
    return emphasize(key_for(node), text);
}

std::string Theme::emphasize(std::string_view key, std::string_view text) const {
    if (!options_.color_enabled || text.empty()) {
        return std::string{text};
    }
    auto it = color_map_.find(std::string{key});
    if (it == color_map_.end() || it->second.empty()) {
        return std::string{text};
    }
    return it->second + std::string{text} + reset();
}

std::string Theme::reset() const {
    return options_.color_enabled ? std::string{"\033[0m"} : std::string{};
}

} // namespace lstree
