#pragma once

#include "connection-registry.h"

#include <string>
#include <map>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>

class MessageRouter;

// RFC 6455 opcodes and close codes used by the server
enum WsOpcode : uint8_t {
    WS_OP_CONTINUATION = 0x0,
    WS_OP_TEXT = 0x1,
    WS_OP_BINARY = 0x2,
    WS_OP_CLOSE = 0x8,
    WS_OP_PING = 0x9,
    WS_OP_PONG = 0xA
};

enum WsCloseCode : uint16_t {
    WS_CLOSE_NORMAL = 1000,
    WS_CLOSE_GOING_AWAY = 1001,
    WS_CLOSE_PROTOCOL_ERROR = 1002,
    WS_CLOSE_UNSUPPORTED_DATA = 1003,
    WS_CLOSE_TOO_BIG = 1009
};

// Unmasked server-to-client frame
std::string encode_ws_frame(uint8_t opcode, const std::string& payload, bool fin = true);

// Server end of one upgraded socket. Writers are serialized; the reader thread
// in WebSocketServer owns the receive side. The fd is closed when the last
// owner lets go.
class WebSocketConnection : public MessageTransport {
public:
    WebSocketConnection(int socket, std::chrono::milliseconds send_timeout);
    ~WebSocketConnection() override;

    bool send_text(const std::string& payload) override;
    void close() override;

    bool send_frame(uint8_t opcode, const std::string& payload);
    // Sends a close frame with the given code, then shuts the socket down
    void close_with(uint16_t code, const std::string& reason = "");

    bool is_closed() const { return closed_.load(); }
    int socket() const { return socket_; }

private:
    int socket_;
    std::atomic<bool> closed_;
    std::mutex send_mutex_;
};

struct HandshakeRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;   // lower-case names
};

class WebSocketServer {
public:
    WebSocketServer(ConnectionRegistry& registry, MessageRouter& router,
                    const std::string& path = "/ws", size_t max_frame_bytes = 16 * 1024 * 1024);
    ~WebSocketServer();

    // port 0 picks a free port; see bound_port()
    bool start(int port);
    void stop();
    bool is_running() const { return running_; }
    int bound_port() const { return bound_port_; }

    size_t active_clients() const;

    void set_send_timeout(std::chrono::milliseconds timeout) { send_timeout_ = timeout; }
    void set_verbose(bool verbose) { verbose_ = verbose; }

    static bool parse_handshake(const std::string& raw, HandshakeRequest& request);

private:
    ConnectionRegistry& registry_;
    MessageRouter& router_;
    std::string path_;
    size_t max_frame_bytes_;
    std::chrono::milliseconds send_timeout_;
    bool verbose_ = false;

    int server_socket_;
    int bound_port_;
    std::atomic<bool> running_;
    std::thread server_thread_;

    size_t active_clients_ = 0;
    mutable std::mutex clients_mutex_;
    std::condition_variable clients_cv_;

    void server_loop();
    void handle_client(int client_socket);
    void serve_connection(const std::string& connection_id, const std::shared_ptr<WebSocketConnection>& conn,
                          int client_socket, std::string& buffered);
    bool perform_handshake(int client_socket, std::string& buffered);
};
