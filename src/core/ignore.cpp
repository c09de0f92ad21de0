#include "lstree/ignore.h"

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "lstree/logger.h"

namespace lstree {
namespace {

// Character class starting at pat[open] == '['. Returns nullopt when the
// class is not terminated, in which case '[' is taken literally.
std::optional<bool> match_class(std::string_view pat, std::size_t open, unsigned char ch, std::size_t& next) {
    std::size_t i = open + 1;
    bool negate = false;
    if (i < pat.size() && (pat[i] == '!' || pat[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < pat.size() && (first || pat[i] != ']')) {
        first = false;
        if (pat[i] == '\\' && i + 1 < pat.size()) {
            ++i;
        }
        const auto lo = static_cast<unsigned char>(pat[i]);
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            std::size_t hi_pos = i + 2;
            if (pat[hi_pos] == '\\' && hi_pos + 1 < pat.size()) {
                ++hi_pos;
            }
            const auto hi = static_cast<unsigned char>(pat[hi_pos]);
            if (lo <= ch && ch <= hi) {
                matched = true;
            }
            i = hi_pos + 1;
        } else {
            if (ch == lo) {
                matched = true;
            }
            ++i;
        }
    }
    if (i >= pat.size()) {
        return std::nullopt;
    }
    next = i + 1;
    return matched != negate;
}

// Backtracking matcher. A (pattern, text) position that failed once is
// recorded so every pair is explored at most once, which keeps patterns with
// many stars polynomial in the name length.
class GlobMatch {
public:
    GlobMatch(std::string_view pat, std::string_view text)
        : pat_{pat}, text_{text}, failed_((pat.size() + 1) * (text.size() + 1), false) {}

    bool operator()() { return match_from(0, 0); }

private:
    bool match_from(std::size_t p, std::size_t t) {
        const auto key = p * (text_.size() + 1) + t;
        if (failed_[key]) {
            return false;
        }
        const bool matched = step(p, t);
        if (!matched) {
            failed_[key] = true;
        }
        return matched;
    }

    bool step(std::size_t p, std::size_t t) {
        const auto pat = pat_;
        const auto text = text_;
        while (p < pat.size()) {
            const char c = pat[p];

            if (c == '*') {
                std::size_t after = p + 1;
                while (after < pat.size() && pat[after] == '*') {
                    ++after;
                }
                const bool double_star = after - p >= 2;
                const bool segment_start = p == 0 || pat[p - 1] == '/';

                if (double_star && segment_start) {
                    if (after == pat.size()) {
                        return true;
                    }
                    if (pat[after] == '/') {
                        // zero or more leading directories
                        for (std::size_t pos = t; pos <= text.size(); ++pos) {
                            if ((pos == t || text[pos - 1] == '/') && match_from(after + 1, pos)) {
                                return true;
                            }
                        }
                        return false;
                    }
                }

                if (after == pat.size()) {
                    return text.find('/', t) == std::string_view::npos;
                }
                for (std::size_t pos = t; pos <= text.size(); ++pos) {
                    if (match_from(after, pos)) {
                        return true;
                    }
                    if (pos < text.size() && text[pos] == '/') {
                        break;
                    }
                }
                return false;
            }

            if (c == '?') {
                if (t >= text.size() || text[t] == '/') {
                    return false;
                }
                ++p;
                ++t;
                continue;
            }

            if (c == '[') {
                if (t >= text.size() || text[t] == '/') {
                    return false;
                }
                std::size_t next = 0;
                if (auto result = match_class(pat, p, static_cast<unsigned char>(text[t]), next)) {
                    if (!*result) {
                        return false;
                    }
                    p = next;
                    ++t;
                    continue;
                }
            }

            char literal = c;
            if (c == '\\' && p + 1 < pat.size()) {
                literal = pat[++p];
            }
            if (t >= text.size() || text[t] != literal) {
                return false;
            }
            ++p;
            ++t;
        }
        return t == text.size();
    }

    std::string_view pat_;
    std::string_view text_;
    std::vector<bool> failed_;
};

std::string_view base_name(std::string_view relative) {
    auto slash = relative.rfind('/');
    return slash == std::string_view::npos ? relative : relative.substr(slash + 1);
}

} // namespace

bool glob_match(std::string_view pattern, std::string_view text) {
    return GlobMatch{pattern, text}();
}

void IgnoreMatcher::add(std::string_view content) {
    std::size_t pos = 0;
    while (pos <= content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        add_line(content.substr(pos, end - pos));
        pos = end + 1;
    }
}

void IgnoreMatcher::add(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        add_line(pattern);
    }
}

void IgnoreMatcher::add_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.empty() || line.front() == '#') {
        return;
    }

    // trailing spaces are dropped unless escaped
    while (!line.empty() && line.back() == ' ') {
        if (line.size() >= 2 && line[line.size() - 2] == '\\') {
            break;
        }
        line.remove_suffix(1);
    }

    Rule rule;
    if (!line.empty() && line.front() == '!') {
        rule.negated = true;
        line.remove_prefix(1);
    } else if (line.size() >= 2 && line.front() == '\\' && (line[1] == '!' || line[1] == '#')) {
        line.remove_prefix(1);
    }

    while (!line.empty() && line.back() == '/') {
        rule.directory_only = true;
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return;
    }

    rule.anchored = line.find('/') != std::string_view::npos;
    if (!line.empty() && line.front() == '/') {
        line.remove_prefix(1);
    }
    if (line.empty()) {
        return;
    }

    rule.pattern.assign(line.begin(), line.end());
    rules_.push_back(std::move(rule));
}

bool IgnoreMatcher::matches(const Rule& rule, std::string_view relative, bool is_directory) const {
    if (rule.directory_only && !is_directory) {
        return false;
    }
    if (rule.anchored) {
        return glob_match(rule.pattern, relative);
    }
    return glob_match(rule.pattern, base_name(relative));
}

bool IgnoreMatcher::evaluate(std::string_view relative, bool is_directory) const {
    bool ignored = false;
    for (const auto& rule : rules_) {
        if (matches(rule, relative, is_directory)) {
            ignored = !rule.negated;
        }
    }
    return ignored;
}

bool IgnoreMatcher::ignores(std::string_view relative, bool is_directory) const {
    if (rules_.empty() || relative.empty()) {
        return false;
    }

    // an excluded parent directory cannot be re-included below
    for (auto slash = relative.find('/'); slash != std::string_view::npos;
         slash = relative.find('/', slash + 1)) {
        if (evaluate(relative.substr(0, slash), true)) {
            return true;
        }
    }
    return evaluate(relative, is_directory);
}

bool IgnoreMatcher::excludes(std::string_view relative, bool is_directory) const {
    if (is_directory && ignores(relative, true)) {
        return true;
    }
    return ignores(relative, false);
}

IgnoreRuleStack IgnoreRuleStack::pushed(std::shared_ptr<const IgnoreMatcher> matcher,
                                        std::filesystem::path directory) const {
    IgnoreRuleStack next{*this};
    next.levels_.push_back(Level{std::move(matcher), std::move(directory)});
    return next;
}

bool IgnoreRuleStack::excludes(const std::filesystem::path& entry, bool is_directory) const {
    for (const auto& level : levels_) {
        if (!level.matcher || level.matcher->empty()) {
            continue;
        }
        const auto relative = entry.lexically_relative(level.directory).generic_string();
        if (relative.empty() || relative == "." || relative == ".." || relative.starts_with("../")) {
            continue;
        }
        if (level.matcher->excludes(relative, is_directory)) {
            Logger::instance().trace("{} excluded by rules declared in {}", entry.string(),
                                     level.directory.string());
            return true;
        }
    }
    return false;
}

std::shared_ptr<const IgnoreMatcher> declare_level(const std::filesystem::path& directory,
                                                   bool is_root,
                                                   const std::vector<std::string>& external_patterns) {
    auto matcher = std::make_shared<IgnoreMatcher>();
    if (is_root) {
        matcher->add(std::vector<std::string>{std::string{kVcsMetadataPattern}});
        matcher->add(external_patterns);
    }

    const auto ignore_file = directory / kIgnoreFileName;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(ignore_file, ec)) {
        return matcher;
    }

    std::ifstream in{ignore_file, std::ios::binary};
    if (!in) {
        Logger::instance().debug("cannot read {}, no rules added", ignore_file.string());
        return matcher;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const auto before = matcher->size();
    matcher->add(buffer.str());
    Logger::instance().debug("{}: {} rule(s)", ignore_file.string(), matcher->size() - before);
    return matcher;
}

} // namespace lstree
