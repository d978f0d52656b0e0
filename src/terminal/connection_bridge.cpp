#include "terminal/connection_bridge.hpp"

#include "utils/logging.hpp"

namespace termgate::terminal {

const char* ToString(BridgeOutcome outcome) {
    switch (outcome) {
        case BridgeOutcome::kCreateFailed: return "create_failed";
        case BridgeOutcome::kKilled: return "killed";
        case BridgeOutcome::kTerminated: return "terminated";
        case BridgeOutcome::kDisconnected: return "disconnected";
    }
    return "unknown";
}

ConnectionBridge::ConnectionBridge(InteractiveSessionManager& sessions)
    : sessions_(sessions) {}

bool ConnectionBridge::Emit(FrameChannel& channel, const OutboundFrame& frame) {
    return channel.Send(SerializeOutboundFrame(frame));
}

BridgeOutcome ConnectionBridge::Run(FrameChannel& channel, const std::string& session_id) {
    const auto created = sessions_.Create(session_id);
    if (!created.success) {
        Emit(channel, ErrorFrame{created.error});
        channel.Close();
        return BridgeOutcome::kCreateFailed;
    }

    auto outcome = BridgeOutcome::kDisconnected;
    if (Emit(channel, SessionCreatedFrame{session_id, created.pid})) {
        while (true) {
            const auto text = channel.Receive();
            if (!text) {
                break;
            }

            InboundFrame frame;
            std::string error;
            if (!ParseInboundFrame(*text, frame, error)) {
                utils::Log(utils::LogLevel::kDebug, "ws", "bad frame", {{"id", session_id}, {"error", error}});
                if (!Emit(channel, ErrorFrame{error})) {
                    break;
                }
                continue;
            }

            if (const auto* input = std::get_if<InputFrame>(&frame)) {
                const auto output = sessions_.Send(session_id, input->data);
                if (!output) {
                    Emit(channel, ErrorFrame{"Session terminated"});
                    Emit(channel, SessionKilledFrame{});
                    outcome = BridgeOutcome::kTerminated;
                    break;
                }
                if (!output->empty() && !Emit(channel, OutputFrame{*output})) {
                    break;
                }
            } else if (const auto* resize = std::get_if<ResizeFrame>(&frame)) {
                sessions_.Resize(session_id, resize->cols, resize->rows);
            } else {
                sessions_.Kill(session_id);
                Emit(channel, SessionKilledFrame{});
                outcome = BridgeOutcome::kKilled;
                break;
            }
        }
    }

    if (outcome == BridgeOutcome::kDisconnected) {
        sessions_.Kill(session_id);
    }
    channel.Close();
    utils::Log(utils::LogLevel::kInfo, "ws", "connection closed",
               {{"id", session_id}, {"outcome", ToString(outcome)}});
    return outcome;
}

}  // namespace termgate::terminal
