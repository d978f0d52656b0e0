#include "utils/common.hpp"

#include <ctime>
#include <iomanip>

namespace termgate::utils {
namespace {

constexpr char kReplacement[] = "\xEF\xBF\xBD";

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}  // namespace

std::string FormatIso(std::chrono::system_clock::time_point time) {
    const auto value = std::chrono::system_clock::to_time_t(time);
    std::tm local_time{};
    localtime_r(&value, &local_time);
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

std::string NowIso() {
    return FormatIso(Now());
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto begin = item.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        const auto end = item.find_last_not_of(" \t");
        items.push_back(item.substr(begin, end - begin + 1));
    }
    return items;
}

std::string SanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    const std::size_t size = bytes.size();
    std::size_t i = 0;
    while (i < size) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        std::size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                low = 0xA0;
            } else if (lead == 0xED) {
                high = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                low = 0x90;
            } else if (lead == 0xF4) {
                high = 0x8F;
            }
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        // Consume the maximal valid prefix; an incomplete sequence becomes one U+FFFD.
        std::size_t consumed = 1;
        bool valid = true;
        while (consumed < length) {
            if (i + consumed >= size) {
                valid = false;
                break;
            }
            const auto c = static_cast<unsigned char>(bytes[i + consumed]);
            const bool in_range = consumed == 1 ? (c >= low && c <= high) : IsContinuation(c);
            if (!in_range) {
                valid = false;
                break;
            }
            ++consumed;
        }
        if (valid) {
            out.append(bytes, i, length);
        } else {
            out += kReplacement;
        }
        i += consumed;
    }
    return out;
}

std::size_t Utf8Length(const std::string& text) {
    std::size_t count = 0;
    for (const char ch : text) {
        if (!IsContinuation(static_cast<unsigned char>(ch))) {
            ++count;
        }
    }
    return count;
}

std::string Utf8Prefix(const std::string& text, std::size_t max_chars) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (IsContinuation(static_cast<unsigned char>(text[i]))) {
            continue;
        }
        if (count == max_chars) {
            return text.substr(0, i);
        }
        ++count;
    }
    return text;
}

}  // namespace termgate::utils
