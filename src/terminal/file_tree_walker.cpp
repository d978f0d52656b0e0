#include "terminal/file_tree_walker.hpp"

#include <algorithm>
#include <filesystem>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace termgate::terminal {
namespace {

namespace fs = std::filesystem;

bool ShouldIgnore(const std::string& name, const std::vector<std::string>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& pattern) {
        return !pattern.empty() && name.find(pattern) != std::string::npos;
    });
}

std::optional<FileNode> BuildNode(const fs::path& path,
                                  int depth,
                                  int max_depth,
                                  const std::vector<std::string>& ignore_patterns) {
    if (depth >= max_depth) {
        return std::nullopt;
    }

    FileNode node{};
    node.name = path.filename().string();
    node.path = path.string();

    std::error_code ec;
    node.is_directory = fs::is_directory(path, ec);
    if (!node.is_directory) {
        const auto size = fs::file_size(path, ec);
        if (ec) {
            return std::nullopt;
        }
        const auto mtime = fs::last_write_time(path, ec);
        if (ec) {
            return std::nullopt;
        }
        node.size = size;
        const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            mtime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
        node.modified = utils::FormatIso(system_time);
        return node;
    }

    std::vector<fs::path> entries;
    fs::directory_iterator it(path, ec);
    if (ec) {
        node.error = "Permission denied";
        return node;
    }
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(it->path());
    }
    if (ec) {
        node.error = "Permission denied";
        return node;
    }

    std::sort(entries.begin(), entries.end());
    for (const auto& entry : entries) {
        if (ShouldIgnore(entry.filename().string(), ignore_patterns)) {
            continue;
        }
        if (auto child = BuildNode(entry, depth + 1, max_depth, ignore_patterns)) {
            node.children.push_back(std::move(*child));
        }
    }
    return node;
}

}  // namespace

const std::vector<std::string>& FileTreeWalker::DefaultIgnorePatterns() {
    static const std::vector<std::string> patterns{
        "__pycache__", ".git", "node_modules", ".venv", "venv", "build"};
    return patterns;
}

FileTreeResult FileTreeWalker::Walk(const std::string& root,
                                    int max_depth,
                                    const std::vector<std::string>& ignore_patterns) {
    FileTreeResult result{};
    std::error_code ec;
    const auto absolute = fs::absolute(root.empty() ? fs::path(".") : fs::path(root), ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }
    const auto resolved = fs::weakly_canonical(absolute, ec);
    const auto& start = ec ? absolute : resolved;
    if (!fs::exists(start, ec)) {
        result.error = "Path does not exist";
        return result;
    }

    result.tree = BuildNode(start, 0, max_depth, ignore_patterns);
    utils::Log(utils::LogLevel::kDebug, "tree", "walked",
               {{"root", start.string()}, {"max_depth", std::to_string(max_depth)}});
    return result;
}

nlohmann::json ToJson(const FileNode& node) {
    nlohmann::json json{
        {"name", node.name},
        {"path", node.path},
        {"type", node.is_directory ? "directory" : "file"}};
    if (node.is_directory) {
        auto children = nlohmann::json::array();
        for (const auto& child : node.children) {
            children.push_back(ToJson(child));
        }
        json["children"] = std::move(children);
        if (node.error) {
            json["error"] = *node.error;
        }
    } else {
        json["size"] = node.size;
        json["modified"] = node.modified;
    }
    return json;
}

}  // namespace termgate::terminal
