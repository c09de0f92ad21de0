#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lstree {

inline constexpr std::string_view kIgnoreFileName = ".gitignore";
inline constexpr std::string_view kVcsMetadataPattern = ".git";

/**
 * Rules declared at one directory level, in gitignore syntax.
 *
 * Paths handed to ignores()/excludes() are relative to the declaring
 * directory and use '/' as separator. Within one matcher the last matching
 * rule decides, so a '!' rule can re-include a name excluded above it.
 */
class IgnoreMatcher {
public:
    IgnoreMatcher() = default;

    // Ignore-file content, one rule per line.
    void add(std::string_view content);
    void add(const std::vector<std::string>& patterns);

    // Single evaluation; directory-only rules apply when is_directory is set.
    bool ignores(std::string_view relative, bool is_directory) const;

    // Directory form first, then the plain form.
    bool excludes(std::string_view relative, bool is_directory) const;

    std::size_t size() const noexcept { return rules_.size(); }
    bool empty() const noexcept { return rules_.empty(); }

private:
    struct Rule {
        std::string pattern;
        bool negated = false;
        bool directory_only = false;
        bool anchored = false;
    };

    void add_line(std::string_view line);
    bool matches(const Rule& rule, std::string_view relative, bool is_directory) const;
    bool evaluate(std::string_view relative, bool is_directory) const;

    std::vector<Rule> rules_;
};

/**
 * Cascading rule stack from the scan root down to the current directory.
 *
 * Levels are immutable once pushed; pushed() returns an extended copy so
 * sibling subtrees never observe each other's rules.
 */
class IgnoreRuleStack {
public:
    struct Level {
        std::shared_ptr<const IgnoreMatcher> matcher;
        std::filesystem::path directory;
    };

    IgnoreRuleStack() = default;

    [[nodiscard]] IgnoreRuleStack pushed(std::shared_ptr<const IgnoreMatcher> matcher,
                                         std::filesystem::path directory) const;

    bool excludes(const std::filesystem::path& entry, bool is_directory) const;

    const std::vector<Level>& levels() const noexcept { return levels_; }
    std::size_t size() const noexcept { return levels_.size(); }
    bool empty() const noexcept { return levels_.empty(); }

private:
    std::vector<Level> levels_;
};

// Matcher for one directory: its own ignore file plus, at the scan root,
// the VCS metadata exclusion and any externally supplied patterns.
std::shared_ptr<const IgnoreMatcher> declare_level(const std::filesystem::path& directory,
                                                   bool is_root,
                                                   const std::vector<std::string>& external_patterns = {});

// True when text matches a gitignore glob ('*', '?', '[...]', '**').
bool glob_match(std::string_view pattern, std::string_view text);

} // namespace lstree
