#include <catch2/catch.hpp>

#include <algorithm>
#include <fstream>
#include <unistd.h>

#include "terminal/file_tree_walker.hpp"
#include "test_helpers.hpp"

using namespace termgate::terminal;
namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path);
    output << content;
}

struct SampleTree {
    termgate::test::TempDir dir{"termgate_tree"};

    SampleTree() {
        WriteFile(dir.path / "b.txt", "hello");
        WriteFile(dir.path / "a" / "inner.txt", "x");
        WriteFile(dir.path / "a" / "deeper" / "leaf.txt", "leaf");
        WriteFile(dir.path / ".git" / "HEAD", "ref");
        WriteFile(dir.path / "node_modules" / "pkg" / "index.js", "");
        WriteFile(dir.path / "my_venv_backup" / "file", "");
    }
};

std::vector<std::string> ChildNames(const FileNode& node) {
    std::vector<std::string> names;
    for (const auto& child : node.children) {
        names.push_back(child.name);
    }
    return names;
}

}  // namespace

TEST_CASE("Depth bounds which nodes are produced", "[tree]") {
    SampleTree sample;
    const auto& ignore = FileTreeWalker::DefaultIgnorePatterns();

    SECTION("depth 0 yields no tree") {
        const auto result = FileTreeWalker::Walk(sample.dir.path.string(), 0, ignore);
        REQUIRE_FALSE(result.error.has_value());
        REQUIRE_FALSE(result.tree.has_value());
    }
    SECTION("depth 1 yields the root with no children") {
        const auto result = FileTreeWalker::Walk(sample.dir.path.string(), 1, ignore);
        REQUIRE(result.tree.has_value());
        REQUIRE(result.tree->is_directory);
        REQUIRE(result.tree->children.empty());
        REQUIRE(result.tree->path == sample.dir.path.string());
    }
    SECTION("depth 2 lists direct children only") {
        const auto result = FileTreeWalker::Walk(sample.dir.path.string(), 2, ignore);
        REQUIRE(ChildNames(*result.tree) == std::vector<std::string>{"a", "b.txt"});
        REQUIRE(result.tree->children[0].children.empty());
    }
    SECTION("depth 3 reaches grandchildren") {
        const auto result = FileTreeWalker::Walk(sample.dir.path.string(), 3, ignore);
        const auto& a = result.tree->children[0];
        REQUIRE(ChildNames(a) == std::vector<std::string>{"deeper", "inner.txt"});
        REQUIRE(a.children[0].children.empty());
    }
}

TEST_CASE("Ignore patterns match substrings of names", "[tree]") {
    SampleTree sample;

    SECTION("default patterns") {
        const auto result = FileTreeWalker::Walk(sample.dir.path.string(), 2, FileTreeWalker::DefaultIgnorePatterns());
        const auto names = ChildNames(*result.tree);
        REQUIRE(std::find(names.begin(), names.end(), ".git") == names.end());
        REQUIRE(std::find(names.begin(), names.end(), "node_modules") == names.end());
        REQUIRE(std::find(names.begin(), names.end(), "my_venv_backup") == names.end());
    }
    SECTION("custom patterns replace the defaults") {
        const auto result = FileTreeWalker::Walk(sample.dir.path.string(), 2, {"b.t"});
        REQUIRE(ChildNames(*result.tree) == std::vector<std::string>{".git", "a", "my_venv_backup", "node_modules"});
    }
}

TEST_CASE("File nodes carry size and modification time", "[tree]") {
    SampleTree sample;
    const auto result = FileTreeWalker::Walk(sample.dir.path.string(), 2, FileTreeWalker::DefaultIgnorePatterns());
    const auto& file = result.tree->children[1];
    REQUIRE_FALSE(file.is_directory);
    REQUIRE(file.size == 5);
    REQUIRE(file.modified.size() == std::string("2024-01-01T00:00:00").size());
    REQUIRE(file.modified[4] == '-');
    REQUIRE(file.modified[10] == 'T');

    const auto json = ToJson(*result.tree);
    REQUIRE(json["type"] == "directory");
    REQUIRE(json["children"][1]["type"] == "file");
    REQUIRE(json["children"][1]["size"] == 5);
    REQUIRE_FALSE(json["children"][1].contains("children"));
}

TEST_CASE("Missing roots are an error", "[tree]") {
    const auto result = FileTreeWalker::Walk("/definitely/not/here", 3, {});
    REQUIRE(result.error == std::optional<std::string>("Path does not exist"));
    REQUIRE_FALSE(result.tree.has_value());
}

TEST_CASE("Relative roots resolve to absolute paths", "[tree]") {
    const auto result = FileTreeWalker::Walk(".", 1, {});
    REQUIRE(result.tree.has_value());
    REQUIRE(fs::path(result.tree->path).is_absolute());
}

TEST_CASE("Unreadable directories are marked, not fatal", "[tree]") {
    if (::geteuid() == 0) {
        WARN("running as root; permissions are not enforced");
        return;
    }
    SampleTree sample;
    const auto locked = sample.dir.path / "a";
    fs::permissions(locked, fs::perms::none);
    const auto result = FileTreeWalker::Walk(sample.dir.path.string(), 3, FileTreeWalker::DefaultIgnorePatterns());
    fs::permissions(locked, fs::perms::owner_all);

    const auto& a = result.tree->children[0];
    REQUIRE(a.error == std::optional<std::string>("Permission denied"));
    REQUIRE(a.children.empty());
}

TEST_CASE("Directories with an error serialize it with no children", "[tree]") {
    FileNode locked{};
    locked.name = "locked";
    locked.path = "/srv/locked";
    locked.is_directory = true;
    locked.error = "Permission denied";

    FileNode root{};
    root.name = "srv";
    root.path = "/srv";
    root.is_directory = true;
    root.children.push_back(locked);

    const auto json = ToJson(root);
    REQUIRE_FALSE(json.contains("error"));
    const auto& child = json["children"][0];
    REQUIRE(child["type"] == "directory");
    REQUIRE(child["error"] == "Permission denied");
    REQUIRE(child["children"].is_array());
    REQUIRE(child["children"].empty());
}
