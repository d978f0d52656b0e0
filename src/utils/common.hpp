#pragma once

#include <chrono>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace termgate::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

// Local time as "%Y-%m-%dT%H:%M:%S".
std::string FormatIso(std::chrono::system_clock::time_point time);
std::string NowIso();

std::vector<std::string> SplitCsv(const std::string& value);

// Decodes bytes as UTF-8, replacing every invalid sequence with U+FFFD.
std::string SanitizeUtf8(const std::string& bytes);

// Number of code points in a valid UTF-8 string.
std::size_t Utf8Length(const std::string& text);

// Keeps the first max_chars code points of a valid UTF-8 string.
std::string Utf8Prefix(const std::string& text, std::size_t max_chars);

}  // namespace termgate::utils
