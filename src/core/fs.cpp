#include "lstree/fs.h"

#include <string>
#include <system_error>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include "lstree/logger.h"

namespace lstree {

std::optional<DirectoryScanner::StatResult> DirectoryScanner::stat_path(const std::filesystem::path& path) const {
#ifndef _WIN32
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }

    StatResult result;
    result.is_symlink = S_ISLNK(st.st_mode);
    result.is_directory = S_ISDIR(st.st_mode);
    result.size = st.st_size > 0 ? static_cast<std::uintmax_t>(st.st_size) : 0;
    return result;
#else
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec || status.type() == std::filesystem::file_type::not_found) {
        return std::nullopt;
    }

    StatResult result;
    result.is_symlink = status.type() == std::filesystem::file_type::symlink;
    result.is_directory = status.type() == std::filesystem::file_type::directory;
    if (status.type() == std::filesystem::file_type::regular) {
        result.size = std::filesystem::file_size(path, ec);
        if (ec) {
            result.size = 0;
        }
    }
    return result;
#endif
}

std::vector<ScannedEntry> DirectoryScanner::scan(const std::filesystem::path& directory) const {
    std::vector<ScannedEntry> entries;
    std::error_code ec;
    std::filesystem::directory_iterator it{directory, ec};
    if (ec) {
        Logger::instance().warn("cannot list {}: {}", directory.string(), ec.message());
        return {};
    }

    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& path = it->path();
        auto stat = stat_path(path);
        if (!stat) {
            Logger::instance().debug("failed to stat {}, dropped", path.string());
            continue;
        }

        ScannedEntry entry;
        entry.name = path.filename().string();
        entry.path = path;
        entry.size = stat->size;
        entry.is_symlink = stat->is_symlink;
        entry.is_directory = stat->is_directory;
        entries.push_back(std::move(entry));
    }
    if (ec) {
        Logger::instance().warn("listing of {} stopped early: {}", directory.string(), ec.message());
    }

    return entries;
}

} // namespace lstree
