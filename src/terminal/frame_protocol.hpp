#pragma once

#include <string>
#include <variant>

namespace termgate::terminal {

struct InputFrame {
    std::string data;
};

struct ResizeFrame {
    int cols = 80;
    int rows = 24;
};

struct KillFrame {};

using InboundFrame = std::variant<InputFrame, ResizeFrame, KillFrame>;

struct SessionCreatedFrame {
    std::string session_id;
    int pid = -1;
};

struct OutputFrame {
    std::string data;
};

struct SessionKilledFrame {};

struct ErrorFrame {
    std::string message;
};

using OutboundFrame = std::variant<SessionCreatedFrame, OutputFrame, SessionKilledFrame, ErrorFrame>;

// Parses one client frame. On failure returns false and fills error with a
// message suitable for an ErrorFrame.
bool ParseInboundFrame(const std::string& text, InboundFrame& frame, std::string& error);

// Invalid UTF-8 in string fields is replaced, never thrown on.
std::string SerializeOutboundFrame(const OutboundFrame& frame);

}  // namespace termgate::terminal
