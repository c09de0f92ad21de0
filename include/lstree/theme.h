#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "lstree/config.h"
#include "lstree/tree.h"

namespace lstree {

class Theme {
public:
    explicit Theme(const Config::Options& options);

    std::string icon_for(const TreeNode& node) const;
    std::string label_for(const TreeNode& node) const;
    std::string colorize(const TreeNode& node, std::string_view text) const;
    std::string emphasize(std::string_view key, std::string_view text) const;
    std::string reset() const;

private:
    void load_default_icons();
    void load_default_colors();
    static std::string key_for(const TreeNode& node);

    const Config::Options& options_;
    std::unordered_map<std::string, std::string> icon_map_;
    std::unordered_map<std::string, std::string> color_map_;
};

} // namespace lstree
