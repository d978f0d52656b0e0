#pragma once

#include <optional>
#include <string>
#include <vector>

namespace termgate::terminal {

struct ValidationVerdict {
    bool allowed = false;
    std::optional<std::string> reason;
    // Shell words of the command; filled whenever tokenization succeeded.
    std::vector<std::string> tokens;
};

class CommandValidator {
public:
    static ValidationVerdict Validate(const std::string& command,
                                      const std::vector<std::string>& allow_list,
                                      const std::vector<std::string>& forbidden_patterns);

    // POSIX shell word splitting. Throws std::invalid_argument on an
    // unterminated quote or a trailing escape.
    static std::vector<std::string> SplitWords(const std::string& command);
};

}  // namespace termgate::terminal
