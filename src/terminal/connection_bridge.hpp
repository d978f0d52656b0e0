#pragma once

#include <optional>
#include <string>

#include "terminal/frame_protocol.hpp"
#include "terminal/interactive_session_manager.hpp"

namespace termgate::terminal {

// A message-framed, bidirectional connection. Implementations must allow
// Close() from another thread while Receive() blocks.
class FrameChannel {
public:
    virtual ~FrameChannel() = default;

    // Blocks for the next text frame; nullopt once the peer is gone.
    virtual std::optional<std::string> Receive() = 0;
    virtual bool Send(const std::string& text) = 0;
    virtual void Close() = 0;
};

enum class BridgeOutcome {
    kCreateFailed,
    kKilled,
    kTerminated,
    kDisconnected
};

const char* ToString(BridgeOutcome outcome);

class ConnectionBridge {
public:
    explicit ConnectionBridge(InteractiveSessionManager& sessions);

    // Drives one connection to completion. The session never outlives the
    // call.
    BridgeOutcome Run(FrameChannel& channel, const std::string& session_id);

private:
    bool Emit(FrameChannel& channel, const OutboundFrame& frame);

    InteractiveSessionManager& sessions_;
};

}  // namespace termgate::terminal
