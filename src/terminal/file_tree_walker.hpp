#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace termgate::terminal {

struct FileNode {
    std::string name;
    std::string path;
    bool is_directory = false;
    std::vector<FileNode> children;
    std::uint64_t size = 0;
    std::string modified;
    std::optional<std::string> error;
};

struct FileTreeResult {
    // Empty when max_depth is 0 or on error.
    std::optional<FileNode> tree;
    std::optional<std::string> error;
};

class FileTreeWalker {
public:
    static const std::vector<std::string>& DefaultIgnorePatterns();

    // Read-only listing. The root is depth 0; nodes at depth >= max_depth are
    // not produced. Entries whose name contains any ignore pattern are
    // skipped.
    static FileTreeResult Walk(const std::string& root,
                               int max_depth,
                               const std::vector<std::string>& ignore_patterns);
};

nlohmann::json ToJson(const FileNode& node);

}  // namespace termgate::terminal
