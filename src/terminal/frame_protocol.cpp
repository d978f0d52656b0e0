#include "terminal/frame_protocol.hpp"

#include "nlohmann/json.hpp"

namespace termgate::terminal {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool ReadDimension(const nlohmann::json& json, const char* key, int fallback, int& value, std::string& error) {
    if (!json.contains(key)) {
        value = fallback;
        return true;
    }
    const auto& field = json[key];
    if (!field.is_number_integer()) {
        error = std::string("Invalid resize frame: '") + key + "' must be an integer";
        return false;
    }
    value = field.get<int>();
    return true;
}

}  // namespace

bool ParseInboundFrame(const std::string& text, InboundFrame& frame, std::string& error) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        error = "Invalid frame: expected a JSON object";
        return false;
    }
    if (!json.contains("type") || !json["type"].is_string()) {
        error = "Invalid frame: missing 'type'";
        return false;
    }

    const auto type = json["type"].get<std::string>();
    if (type == "input") {
        if (!json.contains("data") || !json["data"].is_string()) {
            error = "Invalid input frame: 'data' must be a string";
            return false;
        }
        frame = InputFrame{json["data"].get<std::string>()};
        return true;
    }
    if (type == "resize") {
        ResizeFrame resize{};
        if (!ReadDimension(json, "cols", 80, resize.cols, error)
            || !ReadDimension(json, "rows", 24, resize.rows, error)) {
            return false;
        }
        frame = resize;
        return true;
    }
    if (type == "kill") {
        frame = KillFrame{};
        return true;
    }

    error = "Unknown message type: " + type;
    return false;
}

std::string SerializeOutboundFrame(const OutboundFrame& frame) {
    nlohmann::json json = std::visit(Overloaded{
        [](const SessionCreatedFrame& created) {
            return nlohmann::json{
                {"type", "session_created"},
                {"session_id", created.session_id},
                {"pid", created.pid}};
        },
        [](const OutputFrame& output) {
            return nlohmann::json{{"type", "output"}, {"data", output.data}};
        },
        [](const SessionKilledFrame&) {
            return nlohmann::json{{"type", "session_killed"}};
        },
        [](const ErrorFrame& err) {
            return nlohmann::json{{"type", "error"}, {"message", err.message}};
        }}, frame);
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace termgate::terminal
