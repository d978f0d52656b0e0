#include <catch2/catch.hpp>

#include "utils/common.hpp"
#include "utils/logging.hpp"

using namespace termgate::utils;

TEST_CASE("SanitizeUtf8 keeps valid text and replaces invalid bytes", "[utf8]") {
    REQUIRE(SanitizeUtf8("plain ascii") == "plain ascii");
    REQUIRE(SanitizeUtf8("caf\xC3\xA9") == "caf\xC3\xA9");
    REQUIRE(SanitizeUtf8("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
    // Truncated three-byte sequence: one replacement for the maximal subpart.
    REQUIRE(SanitizeUtf8("\xE2\x82" "x") == "\xEF\xBF\xBD" "x");
    // Overlong encoding and surrogates are invalid.
    REQUIRE(SanitizeUtf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
    REQUIRE(SanitizeUtf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("UTF-8 length and prefix count code points", "[utf8]") {
    const std::string text = "h\xC3\xA9llo \xE2\x82\xAC";
    REQUIRE(Utf8Length(text) == 7);
    REQUIRE(Utf8Prefix(text, 2) == "h\xC3\xA9");
    REQUIRE(Utf8Prefix(text, 100) == text);
    REQUIRE(Utf8Prefix(text, 0).empty());
}

TEST_CASE("SplitCsv trims and drops empty items", "[common]") {
    REQUIRE(SplitCsv(" ls , cat,,  git ") == std::vector<std::string>{"ls", "cat", "git"});
    REQUIRE(SplitCsv("").empty());
}

TEST_CASE("FormatIso renders local time without zone", "[common]") {
    const auto text = FormatIso(Now());
    REQUIRE(text.size() == 19);
    REQUIRE(text[4] == '-');
    REQUIRE(text[10] == 'T');
    REQUIRE(text[13] == ':');
}

TEST_CASE("ParseLogLevel is case insensitive with a fallback", "[logging]") {
    REQUIRE(ParseLogLevel("DEBUG", LogLevel::kInfo) == LogLevel::kDebug);
    REQUIRE(ParseLogLevel("warning", LogLevel::kInfo) == LogLevel::kWarn);
    REQUIRE(ParseLogLevel("chatty", LogLevel::kError) == LogLevel::kError);
}

TEST_CASE("ShouldLog honours the minimum level", "[logging]") {
    SetLogConfig(LogConfig{LogLevel::kWarn});
    REQUIRE_FALSE(ShouldLog(LogLevel::kInfo));
    REQUIRE(ShouldLog(LogLevel::kError));
    SetLogConfig(LogConfig{});
    REQUIRE(ShouldLog(LogLevel::kInfo));
}
