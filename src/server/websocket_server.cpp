#include "server/websocket_server.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <boost/beast/http.hpp>

#include "server/http_api.hpp"
#include "utils/logging.hpp"

namespace termgate::server {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

constexpr int kAcceptPollMs = 200;
constexpr std::size_t kMaxMessageBytes = 1 << 20;

struct AcceptedSocket {
    boost::asio::io_context ioc;
    tcp::socket socket{ioc};
};

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

}  // namespace

WebSocketFrameChannel::WebSocketFrameChannel(websocket::stream<tcp::socket>& ws)
    : ws_(ws) {}

std::optional<std::string> WebSocketFrameChannel::Receive() {
    beast::flat_buffer buffer;
    beast::error_code ec;
    ws_.read(buffer, ec);
    if (ec) {
        if (ec != websocket::error::closed) {
            utils::Log(utils::LogLevel::kDebug, "ws", "read ended", {{"error", ec.message()}});
        }
        return std::nullopt;
    }
    return beast::buffers_to_string(buffer.data());
}

bool WebSocketFrameChannel::Send(const std::string& text) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        return false;
    }
    beast::error_code ec;
    ws_.text(true);
    ws_.write(boost::asio::buffer(text), ec);
    if (ec) {
        utils::Log(utils::LogLevel::kDebug, "ws", "write failed", {{"error", ec.message()}});
        return false;
    }
    return true;
}

void WebSocketFrameChannel::Close() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    if (ws_.is_open()) {
        beast::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
    }
}

std::optional<std::string> SessionIdFromTarget(const std::string& target) {
    auto path = target.substr(0, target.find('?'));
    std::string rest;
    if (StartsWith(path, "/api/terminal/ws/")) {
        rest = path.substr(std::string("/api/terminal/ws/").size());
    } else if (StartsWith(path, "/ws/")) {
        rest = path.substr(std::string("/ws/").size());
    } else if (path == "/api/terminal/ws" || path == "/ws") {
        return std::string();
    } else {
        return std::nullopt;
    }
    if (rest.find('/') != std::string::npos) {
        return std::nullopt;
    }
    return rest;
}

WebSocketServer::WebSocketServer(terminal::ConnectionBridge& bridge)
    : bridge_(bridge)
    , acceptor_(ioc_) {}

WebSocketServer::~WebSocketServer() {
    Stop();
}

bool WebSocketServer::Start(const std::string& host, int port) {
    beast::error_code ec;
    const auto address = boost::asio::ip::make_address(host, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kError, "ws", "invalid listen address", {{"host", host}, {"error", ec.message()}});
        return false;
    }
    const tcp::endpoint endpoint(address, static_cast<unsigned short>(port));
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        utils::Log(utils::LogLevel::kError, "ws", "failed to listen",
                   {{"host", host}, {"port", std::to_string(port)}, {"error", ec.message()}});
        acceptor_.close(ec);
        return false;
    }
    port_ = acceptor_.local_endpoint().port();
    running_.store(true);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });
    utils::Log(utils::LogLevel::kInfo, "ws", "listening", {{"host", host}, {"port", std::to_string(port_)}});
    return true;
}

void WebSocketServer::AcceptLoop() {
    while (running_.load()) {
        JoinFinished();
        pollfd pfd{acceptor_.native_handle(), POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready <= 0) {
            continue;
        }
        // Each connection owns its io_context; the socket is destroyed first.
        auto accepted = std::make_shared<AcceptedSocket>();
        beast::error_code ec;
        acceptor_.accept(accepted->socket, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "ws", "accept failed", {{"error", ec.message()}});
            continue;
        }

        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (!running_.load()) {
            break;
        }
        const auto connection_id = ++next_connection_id_;
        auto& connection = connections_[connection_id];
        connection.fd = accepted->socket.native_handle();
        connection.thread = std::thread([this, accepted, connection_id]() {
            HandleConnection(std::move(accepted->socket), connection_id);
        });
    }
}

void WebSocketServer::JoinFinished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto id : finished_) {
            auto it = connections_.find(id);
            if (it != connections_.end()) {
                done.push_back(std::move(it->second.thread));
                connections_.erase(it);
            }
        }
        finished_.clear();
    }
    for (auto& thread : done) {
        thread.join();
    }
}

void WebSocketServer::HandleConnection(tcp::socket socket, std::size_t connection_id) {
    websocket::stream<tcp::socket> ws(std::move(socket));
    try {
        beast::flat_buffer buffer;
        beast::http::request<beast::http::string_body> request;
        beast::http::read(ws.next_layer(), buffer, request);

        auto session_id = SessionIdFromTarget(std::string(request.target()));
        if (!session_id || !websocket::is_upgrade(request)) {
            beast::http::response<beast::http::string_body> response{beast::http::status::not_found,
                                                                       request.version()};
            response.set(beast::http::field::content_type, "application/json");
            response.body() = R"({"error":"Not found"})";
            response.prepare_payload();
            beast::http::write(ws.next_layer(), response);
        } else {
            if (session_id->empty()) {
                session_id = GenerateSessionId();
            }
            ws.read_message_max(kMaxMessageBytes);
            ws.accept(request);
            utils::Log(utils::LogLevel::kInfo, "ws", "connected", {{"id", *session_id}});
            WebSocketFrameChannel channel(ws);
            bridge_.Run(channel, *session_id);
        }
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "ws", "connection failed", {{"error", ex.what()}});
    }

    beast::error_code ec;
    ws.next_layer().shutdown(tcp::socket::shutdown_both, ec);
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(connection_id);
        if (it != connections_.end()) {
            it->second.fd = -1;
            finished_.push_back(connection_id);
        }
    }
    ws.next_layer().close(ec);
}

void WebSocketServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    beast::error_code ec;
    acceptor_.close(ec);

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& [id, connection] : connections_) {
            if (connection.fd >= 0) {
                // Unblocks the connection's pending read; its bridge then kills the session.
                ::shutdown(connection.fd, SHUT_RDWR);
            }
            threads.push_back(std::move(connection.thread));
        }
        connections_.clear();
        finished_.clear();
    }
    for (auto& thread : threads) {
        thread.join();
    }
    utils::Log(utils::LogLevel::kInfo, "ws", "stopped", {{"joined", std::to_string(threads.size())}});
}

std::size_t WebSocketServer::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size() - finished_.size();
}

}  // namespace termgate::server
