#include <catch2/catch.hpp>

#include "nlohmann/json.hpp"
#include "terminal/frame_protocol.hpp"

using namespace termgate::terminal;

TEST_CASE("Inbound frames parse by type", "[frames]") {
    InboundFrame frame;
    std::string error;

    SECTION("input") {
        REQUIRE(ParseInboundFrame(R"({"type":"input","data":"ls\n"})", frame, error));
        REQUIRE(std::get<InputFrame>(frame).data == "ls\n");
    }
    SECTION("resize with dimensions") {
        REQUIRE(ParseInboundFrame(R"({"type":"resize","cols":120,"rows":40})", frame, error));
        const auto& resize = std::get<ResizeFrame>(frame);
        REQUIRE(resize.cols == 120);
        REQUIRE(resize.rows == 40);
    }
    SECTION("resize without dimensions uses defaults") {
        REQUIRE(ParseInboundFrame(R"({"type":"resize"})", frame, error));
        REQUIRE(std::get<ResizeFrame>(frame).cols == 80);
        REQUIRE(std::get<ResizeFrame>(frame).rows == 24);
    }
    SECTION("kill") {
        REQUIRE(ParseInboundFrame(R"({"type":"kill"})", frame, error));
        REQUIRE(std::holds_alternative<KillFrame>(frame));
    }
}

TEST_CASE("Malformed inbound frames report an error", "[frames]") {
    InboundFrame frame;
    std::string error;

    REQUIRE_FALSE(ParseInboundFrame("not json", frame, error));
    REQUIRE_FALSE(error.empty());

    REQUIRE_FALSE(ParseInboundFrame("[1,2]", frame, error));
    REQUIRE_FALSE(ParseInboundFrame(R"({"data":"x"})", frame, error));
    REQUIRE(error == "Invalid frame: missing 'type'");

    REQUIRE_FALSE(ParseInboundFrame(R"({"type":"launch"})", frame, error));
    REQUIRE(error == "Unknown message type: launch");

    REQUIRE_FALSE(ParseInboundFrame(R"({"type":"input","data":42})", frame, error));
    REQUIRE_FALSE(ParseInboundFrame(R"({"type":"resize","cols":"wide"})", frame, error));
}

TEST_CASE("Outbound frames serialize with a type discriminator", "[frames]") {
    auto created = nlohmann::json::parse(SerializeOutboundFrame(SessionCreatedFrame{"abc", 4242}));
    REQUIRE(created == nlohmann::json{{"type", "session_created"}, {"session_id", "abc"}, {"pid", 4242}});

    auto output = nlohmann::json::parse(SerializeOutboundFrame(OutputFrame{"hello\n"}));
    REQUIRE(output == nlohmann::json{{"type", "output"}, {"data", "hello\n"}});

    auto killed = nlohmann::json::parse(SerializeOutboundFrame(SessionKilledFrame{}));
    REQUIRE(killed == nlohmann::json{{"type", "session_killed"}});

    auto error = nlohmann::json::parse(SerializeOutboundFrame(ErrorFrame{"Session terminated"}));
    REQUIRE(error == nlohmann::json{{"type", "error"}, {"message", "Session terminated"}});
}

TEST_CASE("Invalid UTF-8 in outbound data does not throw", "[frames]") {
    std::string text;
    REQUIRE_NOTHROW(text = SerializeOutboundFrame(OutputFrame{"a\xFF" "b"}));
    const auto json = nlohmann::json::parse(text);
    REQUIRE(json["data"] == "a\xEF\xBF\xBD" "b");
}
