#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lstree {

struct ScannedEntry {
    std::string name;
    std::filesystem::path path;
    std::uintmax_t size = 0;
    bool is_symlink = false;
    bool is_directory = false;
};

// Lists the immediate children of a directory without following symlinks.
class DirectoryScanner {
public:
    struct StatResult {
        std::uintmax_t size = 0;
        bool is_symlink = false;
        bool is_directory = false;
    };

    DirectoryScanner() = default;

    // Empty when the directory cannot be listed; entries that fail to stat are dropped.
    std::vector<ScannedEntry> scan(const std::filesystem::path& directory) const;

    // Link-aware stat of a single path.
    std::optional<StatResult> stat_path(const std::filesystem::path& path) const;
};

} // namespace lstree
