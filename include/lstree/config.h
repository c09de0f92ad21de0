#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lstree/logger.h"
#include "lstree/tree.h"

namespace lstree {

class Config {
public:
    struct Options {
        std::filesystem::path path{"."};
        std::optional<std::size_t> max_leaf;
        std::vector<std::string> ignore_patterns;

        bool show_summary = false;
        bool color_enabled = true;
        bool icons_enabled = true;
        bool dump_markdown = false;

        Logger::Level log_level = Logger::Level::Error;
    };

    static Config& instance();

    void set_options(Options options);
    const Options& options() const noexcept;

    // Scan settings for TreeBuilder; the stop token is left unset.
    BuildOptions build_options() const;

    // Base name of argv[0]; "lstree" until set.
    void set_program_name(std::string_view name);
    std::string_view program_name() const noexcept;

private:
    Config() = default;

    Options options_{};
    std::string program_name_{"lstree"};
};

} // namespace lstree
