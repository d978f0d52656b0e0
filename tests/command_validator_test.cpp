#include <catch2/catch.hpp>

#include "terminal/command_validator.hpp"

using termgate::terminal::CommandValidator;

namespace {

const std::vector<std::string> kAllowed{"ls", "pwd", "cat", "echo", "grep", "python", "git"};
const std::vector<std::string> kForbidden{"rm -rf /", "sudo", "chmod 777", "curl | bash"};

}  // namespace

TEST_CASE("Allowed commands pass and keep their tokens", "[validator]") {
    const auto verdict = CommandValidator::Validate("ls -la /tmp", kAllowed, kForbidden);
    REQUIRE(verdict.allowed);
    REQUIRE_FALSE(verdict.reason.has_value());
    REQUIRE(verdict.tokens == std::vector<std::string>{"ls", "-la", "/tmp"});
}

TEST_CASE("Forbidden patterns are rejected by substring", "[validator]") {
    SECTION("pattern inside an allowed command") {
        const auto verdict = CommandValidator::Validate("echo hi && sudo reboot", kAllowed, kForbidden);
        REQUIRE_FALSE(verdict.allowed);
        REQUIRE(*verdict.reason == "Command contains forbidden pattern: sudo");
    }
    SECTION("pattern wins even with an empty allow-list") {
        const auto verdict = CommandValidator::Validate("rm -rf /", {}, kForbidden);
        REQUIRE_FALSE(verdict.allowed);
        REQUIRE(verdict.reason->find("rm -rf /") != std::string::npos);
    }
    SECTION("matching is case sensitive") {
        const auto verdict = CommandValidator::Validate("echo SUDO", kAllowed, kForbidden);
        REQUIRE(verdict.allowed);
    }
}

TEST_CASE("Commands outside the allow-list are rejected", "[validator]") {
    const auto verdict = CommandValidator::Validate("rm file.txt", kAllowed, kForbidden);
    REQUIRE_FALSE(verdict.allowed);
    REQUIRE(*verdict.reason == "Command 'rm' is not allowed");
}

TEST_CASE("Path-qualified commands match by basename", "[validator]") {
    REQUIRE(CommandValidator::Validate("/usr/bin/python script.py", kAllowed, kForbidden).allowed);
    REQUIRE_FALSE(CommandValidator::Validate("/usr/bin/perl script.pl", kAllowed, kForbidden).allowed);
}

TEST_CASE("An empty allow-list is unrestricted", "[validator]") {
    const auto verdict = CommandValidator::Validate("make -j8", {}, kForbidden);
    REQUIRE(verdict.allowed);
    REQUIRE(verdict.tokens.front() == "make");
}

TEST_CASE("Empty and blank commands are rejected", "[validator]") {
    for (const std::string command : {"", "   ", "\t\n"}) {
        const auto verdict = CommandValidator::Validate(command, kAllowed, kForbidden);
        REQUIRE_FALSE(verdict.allowed);
        REQUIRE(*verdict.reason == "Empty command");
    }
}

TEST_CASE("Malformed quoting is a rejection, not a crash", "[validator]") {
    SECTION("unbalanced single quote") {
        const auto verdict = CommandValidator::Validate("echo 'abc", kAllowed, kForbidden);
        REQUIRE_FALSE(verdict.allowed);
        REQUIRE(*verdict.reason == "Invalid command format: No closing quotation");
    }
    SECTION("unbalanced double quote") {
        const auto verdict = CommandValidator::Validate("echo \"abc", kAllowed, kForbidden);
        REQUIRE_FALSE(verdict.allowed);
        REQUIRE(verdict.reason->rfind("Invalid command format:", 0) == 0);
    }
    SECTION("trailing backslash") {
        const auto verdict = CommandValidator::Validate("echo abc\\", kAllowed, kForbidden);
        REQUIRE_FALSE(verdict.allowed);
        REQUIRE(*verdict.reason == "Invalid command format: No escaped character");
    }
}

TEST_CASE("Shell words follow POSIX quoting", "[validator]") {
    REQUIRE(CommandValidator::SplitWords("echo 'a b' \"c d\"")
            == std::vector<std::string>{"echo", "a b", "c d"});
    REQUIRE(CommandValidator::SplitWords(R"(echo "say \"hi\"" 'it''s')")
            == std::vector<std::string>{"echo", "say \"hi\"", "its"});
    REQUIRE(CommandValidator::SplitWords(R"(echo a\ b '\n')")
            == std::vector<std::string>{"echo", "a b", "\\n"});
    REQUIRE(CommandValidator::SplitWords("echo a#b")
            == std::vector<std::string>{"echo", "a#b"});
    REQUIRE(CommandValidator::SplitWords("echo ''")
            == std::vector<std::string>{"echo", ""});
}

TEST_CASE("A hash is an ordinary character", "[validator]") {
    REQUIRE(CommandValidator::SplitWords("echo #x")
            == std::vector<std::string>{"echo", "#x"});
    REQUIRE(CommandValidator::SplitWords("grep x # trailing")
            == std::vector<std::string>{"grep", "x", "#", "trailing"});

    const auto verdict = CommandValidator::Validate("#x", {}, {});
    REQUIRE(verdict.allowed);
    REQUIRE(verdict.tokens == std::vector<std::string>{"#x"});
}

TEST_CASE("Inside double quotes only quote and backslash are escaped", "[validator]") {
    REQUIRE(CommandValidator::SplitWords(R"(echo "\$HOME" "\`id\`" "a\\b" "\"")")
            == std::vector<std::string>{"echo", "\\$HOME", "\\`id\\`", "a\\b", "\""});
    // Outside quotes a backslash escapes anything, newline included.
    REQUIRE(CommandValidator::SplitWords("echo a\\\nb")
            == std::vector<std::string>{"echo", "a\nb"});
}

TEST_CASE("The first word decides, not the rest of the line", "[validator]") {
    // Argv mode never hands these to a shell, so only the first word is checked.
    const auto verdict = CommandValidator::Validate("echo hi; rm x", kAllowed, kForbidden);
    REQUIRE(verdict.allowed);
    REQUIRE(verdict.tokens == std::vector<std::string>{"echo", "hi;", "rm", "x"});
}
