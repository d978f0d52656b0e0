#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "terminal/connection_bridge.hpp"

namespace termgate::server {

// FrameChannel over one accepted WebSocket stream. Only Send may be called
// concurrently with Receive.
class WebSocketFrameChannel : public terminal::FrameChannel {
public:
    explicit WebSocketFrameChannel(
        boost::beast::websocket::stream<boost::asio::ip::tcp::socket>& ws);

    std::optional<std::string> Receive() override;
    bool Send(const std::string& text) override;
    void Close() override;

private:
    boost::beast::websocket::stream<boost::asio::ip::tcp::socket>& ws_;
    std::mutex write_mutex_;
    bool closed_ = false;
};

// Extracts the session id from "/api/terminal/ws/{id}" or "/ws/{id}".
// nullopt for any other target; an empty id means "generate one".
std::optional<std::string> SessionIdFromTarget(const std::string& target);

// Accepts WebSocket connections and runs one ConnectionBridge per
// connection on its own thread.
class WebSocketServer {
public:
    explicit WebSocketServer(terminal::ConnectionBridge& bridge);
    ~WebSocketServer();
    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Binds and starts accepting. Port 0 picks a free port.
    bool Start(const std::string& host, int port);
    unsigned short Port() const { return port_; }

    // Stops accepting, disconnects every client and joins every connection
    // thread. A bridge blocked on a busy session holds Stop until that
    // session ends.
    void Stop();

    std::size_t ConnectionCount() const;

private:
    struct Connection {
        // -1 once the handler has stopped using the socket.
        int fd = -1;
        std::thread thread;
    };

    void AcceptLoop();
    void HandleConnection(boost::asio::ip::tcp::socket socket, std::size_t connection_id);
    void JoinFinished();

    terminal::ConnectionBridge& bridge_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    unsigned short port_ = 0;

    mutable std::mutex connections_mutex_;
    std::unordered_map<std::size_t, Connection> connections_;
    std::vector<std::size_t> finished_;
    std::size_t next_connection_id_ = 0;
};

}  // namespace termgate::server
