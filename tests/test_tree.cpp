#include <catch2/catch_test_macros.hpp>
#include "lstree/tree.h"
#include "TestHelpers.hpp"

#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

using lstree::BuildOptions;
using lstree::TreeBuilder;
using lstree::TreeNode;

namespace {

TreeNode build(const std::filesystem::path& root, BuildOptions options = {}) {
    TreeBuilder builder{std::move(options)};
    return builder.build(root);
}

bool contains_name_anywhere(const TreeNode& node, std::string_view name) {
    if (node.name == name) {
        return true;
    }
    if (!node.children) {
        return false;
    }
    for (const auto& child : *node.children) {
        if (contains_name_anywhere(child, name)) {
            return true;
        }
    }
    return false;
}

bool same_shape(const TreeNode& lhs, const TreeNode& rhs) {
    if (lhs.name != rhs.name || lhs.kind != rhs.kind || lhs.skip != rhs.skip ||
        lhs.children.has_value() != rhs.children.has_value()) {
        return false;
    }
    if (!lhs.children) {
        return true;
    }
    if (lhs.children->size() != rhs.children->size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.children->size(); ++i) {
        if (!same_shape((*lhs.children)[i], (*rhs.children)[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("nested files and folders are listed folders first") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "src" / "index.ts");
    write_file(temp_dir.path() / "README.md", "# Helper");
    write_file(temp_dir.path() / "b.txt");
    write_file(temp_dir.path() / "Zeta" / "z.txt");
    write_file(temp_dir.path() / "alpha" / "a.txt");

    auto tree = build(temp_dir.path());
    CHECK(tree.name == temp_dir.path().filename().string());
    CHECK(tree.kind == TreeNode::Kind::Folder);
    CHECK(tree.skip == TreeNode::SkipReason::None);
    REQUIRE(tree.children.has_value());
    CHECK(child_names(tree) == std::vector<std::string>{"Zeta", "alpha", "src", "README.md", "b.txt"});

    const auto* src = find_child(tree, "src");
    REQUIRE(src != nullptr);
    CHECK(src->kind == TreeNode::Kind::Folder);
    CHECK(child_names(*src) == std::vector<std::string>{"index.ts"});

    const auto* readme = find_child(tree, "README.md");
    REQUIRE(readme != nullptr);
    CHECK(readme->size == 8);
    CHECK_FALSE(readme->children.has_value());
}

TEST_CASE("child paths are the parent path joined with the child name") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "one" / "two" / "three.txt");

    auto tree = build(temp_dir.path());
    CHECK(tree.path.is_absolute());
    std::function<void(const TreeNode&)> check_paths = [&](const TreeNode& node) {
        if (!node.children) {
            return;
        }
        for (const auto& child : *node.children) {
            CHECK(child.path == node.path / child.name);
            check_paths(child);
        }
    };
    check_paths(tree);
}

TEST_CASE("root .gitignore collapses directories and drops files") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".gitignore", "ignored.txt\nnode_modules");
    write_file(temp_dir.path() / "ignored.txt");
    write_file(temp_dir.path() / "included.txt");
    write_file(temp_dir.path() / "node_modules" / "pkg.json", "{}");

    auto tree = build(temp_dir.path());
    auto names = child_names(tree);
    CHECK(std::find(names.begin(), names.end(), "included.txt") != names.end());
    CHECK(std::find(names.begin(), names.end(), "ignored.txt") == names.end());

    const auto* node_modules = find_child(tree, "node_modules");
    REQUIRE(node_modules != nullptr);
    CHECK(node_modules->kind == TreeNode::Kind::Folder);
    CHECK(node_modules->skip == TreeNode::SkipReason::IgnoredByRule);
    CHECK_FALSE(node_modules->children.has_value());
}

TEST_CASE("the .git directory is always collapsed") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".git" / "HEAD", "ref: refs/heads/main");

    auto tree = build(temp_dir.path());
    const auto* git = find_child(tree, ".git");
    REQUIRE(git != nullptr);
    CHECK(git->skip == TreeNode::SkipReason::IgnoredByRule);
}

TEST_CASE("directory-only pattern leaves same-prefixed files alone") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".gitignore", "coverage/\n");
    write_file(temp_dir.path() / "coverage" / "lcov.info");
    write_file(temp_dir.path() / "coverage_file");

    auto tree = build(temp_dir.path());
    const auto* coverage = find_child(tree, "coverage");
    REQUIRE(coverage != nullptr);
    CHECK(coverage->skip == TreeNode::SkipReason::IgnoredByRule);

    const auto* coverage_file = find_child(tree, "coverage_file");
    REQUIRE(coverage_file != nullptr);
    CHECK(coverage_file->kind == TreeNode::Kind::File);
}

TEST_CASE("a root rule with a slash only excludes that nested path") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".gitignore", "src/ignore.txt\n");
    write_file(temp_dir.path() / "src" / "ignore.txt");
    write_file(temp_dir.path() / "src" / "keep.txt");
    write_file(temp_dir.path() / "ignore.txt");

    auto tree = build(temp_dir.path());
    CHECK(find_child(tree, "ignore.txt") != nullptr);
    const auto* src = find_child(tree, "src");
    REQUIRE(src != nullptr);
    CHECK(child_names(*src) == std::vector<std::string>{"keep.txt"});
}

TEST_CASE("nested .gitignore applies only below its own directory") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "app" / ".gitignore", "/build\n*.log\n");
    write_file(temp_dir.path() / "app" / "build" / "out.bin");
    write_file(temp_dir.path() / "app" / "run.log");
    write_file(temp_dir.path() / "app" / "main.cpp");
    write_file(temp_dir.path() / "lib" / "build" / "out.bin");
    write_file(temp_dir.path() / "lib" / "run.log");

    auto tree = build(temp_dir.path());
    const auto* app = find_child(tree, "app");
    REQUIRE(app != nullptr);
    const auto* app_build = find_child(*app, "build");
    REQUIRE(app_build != nullptr);
    CHECK(app_build->skip == TreeNode::SkipReason::IgnoredByRule);
    CHECK(find_child(*app, "run.log") == nullptr);
    CHECK(find_child(*app, "main.cpp") != nullptr);

    const auto* lib = find_child(tree, "lib");
    REQUIRE(lib != nullptr);
    const auto* lib_build = find_child(*lib, "build");
    REQUIRE(lib_build != nullptr);
    CHECK(lib_build->skip == TreeNode::SkipReason::None);
    CHECK(find_child(*lib, "run.log") != nullptr);
}

TEST_CASE("root rules keep applying inside nested directories") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".gitignore", "*.tmp\n");
    write_file(temp_dir.path() / "pkg" / ".gitignore", "dist/\n");
    write_file(temp_dir.path() / "pkg" / "a.tmp");
    write_file(temp_dir.path() / "pkg" / "dist" / "bundle.js");
    write_file(temp_dir.path() / "pkg" / "index.js");

    auto tree = build(temp_dir.path());
    const auto* pkg = find_child(tree, "pkg");
    REQUIRE(pkg != nullptr);
    CHECK(child_names(*pkg) == std::vector<std::string>{"dist", ".gitignore", "index.js"});
    CHECK(find_child(*pkg, "dist")->skip == TreeNode::SkipReason::IgnoredByRule);
}

TEST_CASE("external patterns apply from the root") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "vendor" / "lib.c");
    write_file(temp_dir.path() / "deep" / "vendor" / "lib.c");
    write_file(temp_dir.path() / "main.c");

    BuildOptions options;
    options.ignore_patterns = {"vendor/"};
    auto tree = build(temp_dir.path(), options);
    CHECK(find_child(tree, "vendor")->skip == TreeNode::SkipReason::IgnoredByRule);
    const auto* deep = find_child(tree, "deep");
    REQUIRE(deep != nullptr);
    CHECK(find_child(*deep, "vendor")->skip == TreeNode::SkipReason::IgnoredByRule);
}

TEST_CASE("max leaf collapses directories with too many visible entries") {
    TempDir temp_dir;
    for (int i = 0; i < 5; ++i) {
        write_file(temp_dir.path() / "large-dir" / ("file" + std::to_string(i) + ".txt"));
    }

    BuildOptions options;
    options.max_leaf = 3;
    auto tree = build(temp_dir.path(), options);
    const auto* large = find_child(tree, "large-dir");
    REQUIRE(large != nullptr);
    CHECK(large->kind == TreeNode::Kind::Folder);
    CHECK(large->skip == TreeNode::SkipReason::TooManyEntries);
    CHECK_FALSE(large->children.has_value());
}

TEST_CASE("max leaf counts visible entries only") {
    TempDir temp_dir;
    const auto dir = temp_dir.path() / "mixed";
    write_file(dir / ".gitignore", "*.log\n");
    write_file(dir / "a.log");
    write_file(dir / "b.log");
    write_file(dir / "keep.txt");

    BuildOptions options;
    options.max_leaf = 3;
    auto tree = build(temp_dir.path(), options);
    const auto* mixed = find_child(tree, "mixed");
    REQUIRE(mixed != nullptr);
    CHECK(mixed->skip == TreeNode::SkipReason::None);
    CHECK(child_names(*mixed) == std::vector<std::string>{".gitignore", "keep.txt"});
}

TEST_CASE("max leaf with three of five files ignored keeps the directory expanded") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".gitignore", "dir/ignored*\n");
    const auto dir = temp_dir.path() / "dir";
    write_file(dir / "ignored1");
    write_file(dir / "ignored2");
    write_file(dir / "ignored3");
    write_file(dir / "one");
    write_file(dir / "two");

    BuildOptions options;
    options.max_leaf = 3;
    auto tree = build(temp_dir.path(), options);
    const auto* node = find_child(tree, "dir");
    REQUIRE(node != nullptr);
    CHECK(node->skip == TreeNode::SkipReason::None);
    CHECK(child_names(*node) == std::vector<std::string>{"one", "two"});
}

TEST_CASE("symbolic links never become nodes") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "target" / "file.txt");
    std::filesystem::create_directory_symlink(temp_dir.path() / "target", temp_dir.path() / "link");
    std::filesystem::create_symlink(temp_dir.path() / "target" / "file.txt",
                                    temp_dir.path() / "target" / "file-link.txt");

    auto tree = build(temp_dir.path());
    CHECK(find_child(tree, "link") == nullptr);
    CHECK_FALSE(contains_name_anywhere(tree, "file-link.txt"));
    const auto* target = find_child(tree, "target");
    REQUIRE(target != nullptr);
    CHECK(child_names(*target) == std::vector<std::string>{"file.txt"});
}

TEST_CASE("missing root degrades to an empty file node") {
    TempDir temp_dir;
    auto tree = build(temp_dir.path() / "nope");
    CHECK(tree.kind == TreeNode::Kind::File);
    CHECK(tree.size == 0);
    CHECK(tree.name == "nope");
}

TEST_CASE("a symlink passed as the root is shown as an empty file") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "target" / "file.txt", "content");
    std::filesystem::create_directory_symlink(temp_dir.path() / "target", temp_dir.path() / "lnk");

    auto tree = build(temp_dir.path() / "lnk");
    CHECK(tree.kind == TreeNode::Kind::File);
    CHECK(tree.size == 0);
    CHECK(tree.name == "lnk");
    CHECK_FALSE(tree.children.has_value());
}

TEST_CASE("a directory that cannot be listed becomes an empty folder") {
#ifndef _WIN32
    if (::geteuid() == 0) {
        SKIP("permission bits do not restrict root");
    }
#endif
    TempDir temp_dir;
    const auto locked = temp_dir.path() / "locked";
    write_file(locked / "hidden.txt");
    std::filesystem::permissions(locked, std::filesystem::perms::none);

    auto tree = build(temp_dir.path());
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

    const auto* node = find_child(tree, "locked");
    REQUIRE(node != nullptr);
    CHECK(node->kind == TreeNode::Kind::Folder);
    CHECK(node->skip == TreeNode::SkipReason::None);
    REQUIRE(node->children.has_value());
    CHECK(node->children->empty());
}

TEST_CASE("root path with a trailing separator keeps its name") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "x.txt");
    auto tree = build(temp_dir.path().string() + "/");
    CHECK(tree.name == temp_dir.path().filename().string());
    CHECK(child_names(tree) == std::vector<std::string>{"x.txt"});
}

TEST_CASE("building twice gives the same tree") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".gitignore", "tmp/\n");
    write_file(temp_dir.path() / "tmp" / "x");
    write_file(temp_dir.path() / "a" / "b" / "c.txt");
    write_file(temp_dir.path() / "d.txt");

    auto first = build(temp_dir.path());
    auto second = build(temp_dir.path());
    CHECK(same_shape(first, second));
}

TEST_CASE("a stop request aborts the scan") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a" / "b.txt");

    std::stop_source source;
    source.request_stop();
    BuildOptions options;
    options.stop = source.get_token();
    TreeBuilder builder{options};
    CHECK_THROWS_AS(builder.build(temp_dir.path()), lstree::ScanCancelled);
}
