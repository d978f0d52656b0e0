#include "terminal/command_validator.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace termgate::terminal {
namespace {

bool IsBlank(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

bool Contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

}  // namespace

std::vector<std::string> CommandValidator::SplitWords(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    const std::size_t size = command.size();
    std::size_t i = 0;
    while (i < size) {
        const char ch = command[i];
        if (IsBlank(ch)) {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            ++i;
            continue;
        }
        in_word = true;
        if (ch == '\\') {
            if (i + 1 >= size) {
                throw std::invalid_argument("No escaped character");
            }
            current.push_back(command[i + 1]);
            i += 2;
            continue;
        }
        if (ch == '\'') {
            const auto close = command.find('\'', i + 1);
            if (close == std::string::npos) {
                throw std::invalid_argument("No closing quotation");
            }
            current.append(command, i + 1, close - i - 1);
            i = close + 1;
            continue;
        }
        if (ch == '"') {
            ++i;
            bool closed = false;
            while (i < size) {
                const char inner = command[i];
                if (inner == '"') {
                    closed = true;
                    ++i;
                    break;
                }
                if (inner == '\\' && i + 1 < size) {
                    const char next = command[i + 1];
                    // Only the quote and the backslash itself are escapable here.
                    if (next == '"' || next == '\\') {
                        current.push_back(next);
                        i += 2;
                        continue;
                    }
                }
                current.push_back(inner);
                ++i;
            }
            if (!closed) {
                throw std::invalid_argument("No closing quotation");
            }
            continue;
        }
        current.push_back(ch);
        ++i;
    }
    if (in_word) {
        words.push_back(std::move(current));
    }
    return words;
}

ValidationVerdict CommandValidator::Validate(const std::string& command,
                                             const std::vector<std::string>& allow_list,
                                             const std::vector<std::string>& forbidden_patterns) {
    ValidationVerdict verdict{};
    for (const auto& pattern : forbidden_patterns) {
        if (!pattern.empty() && command.find(pattern) != std::string::npos) {
            verdict.reason = "Command contains forbidden pattern: " + pattern;
            return verdict;
        }
    }

    try {
        verdict.tokens = SplitWords(command);
    } catch (const std::invalid_argument& ex) {
        verdict.reason = std::string("Invalid command format: ") + ex.what();
        return verdict;
    }
    if (verdict.tokens.empty()) {
        verdict.reason = "Empty command";
        return verdict;
    }

    const auto& base_command = verdict.tokens.front();
    if (!allow_list.empty() && !Contains(allow_list, base_command)) {
        // Permit path-qualified invocations such as /usr/bin/python.
        const auto command_name = std::filesystem::path(base_command).filename().string();
        if (!Contains(allow_list, command_name)) {
            verdict.reason = "Command '" + base_command + "' is not allowed";
            return verdict;
        }
    }

    verdict.allowed = true;
    return verdict;
}

}  // namespace termgate::terminal
