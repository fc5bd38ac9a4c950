#include "websocket-server.h"
#include "message-router.h"
#include "relay-util.h"

#include <iostream>
#include <sstream>
#include <algorithm>
#include <cstring>
#include <cctype>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>

static const size_t kMaxHandshakeBytes = 8192;
static const size_t kMaxControlPayload = 125;

static void set_socket_timeout(int socket, int option, std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(socket, SOL_SOCKET, option, &tv, sizeof(tv));
}

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

// Reads exactly n bytes, draining bytes left over from the handshake first
static bool read_buffered(int socket, std::string& buffered, char* out, size_t n) {
    size_t from_buffer = std::min(n, buffered.size());
    if (from_buffer > 0) {
        std::memcpy(out, buffered.data(), from_buffer);
        buffered.erase(0, from_buffer);
    }
    if (from_buffer == n) {
        return true;
    }
    return read_exact_fd(socket, out + from_buffer, n - from_buffer);
}

std::string encode_ws_frame(uint8_t opcode, const std::string& payload, bool fin) {
    std::string frame;
    frame.reserve(payload.size() + 10);
    frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

    uint64_t len = payload.size();
    if (len < 126) {
        frame.push_back(static_cast<char>(len));
    } else if (len <= 0xFFFF) {
        frame.push_back(static_cast<char>(126));
        frame.push_back(static_cast<char>((len >> 8) & 0xFF));
        frame.push_back(static_cast<char>(len & 0xFF));
    } else {
        frame.push_back(static_cast<char>(127));
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame.push_back(static_cast<char>((len >> shift) & 0xFF));
        }
    }
    frame += payload;
    return frame;
}

// ---------------------------------------------------------------------------
// WebSocketConnection

WebSocketConnection::WebSocketConnection(int socket, std::chrono::milliseconds send_timeout)
    : socket_(socket), closed_(false) {
    set_socket_timeout(socket_, SO_SNDTIMEO, send_timeout);
}

WebSocketConnection::~WebSocketConnection() {
    if (socket_ >= 0) {
        ::close(socket_);
        socket_ = -1;
    }
}

bool WebSocketConnection::send_text(const std::string& payload) {
    return send_frame(WS_OP_TEXT, payload);
}

bool WebSocketConnection::send_frame(uint8_t opcode, const std::string& payload) {
    if (closed_.load()) {
        return false;
    }
    std::string frame = encode_ws_frame(opcode, payload);
    std::lock_guard<std::mutex> lock(send_mutex_);
    return write_all_fd(socket_, frame.data(), frame.size());
}

void WebSocketConnection::close() {
    close_with(WS_CLOSE_GOING_AWAY);
}

void WebSocketConnection::close_with(uint16_t code, const std::string& reason) {
    if (closed_.exchange(true)) {
        return;
    }
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    payload += reason.substr(0, kMaxControlPayload - 2);
    std::string frame = encode_ws_frame(WS_OP_CLOSE, payload);
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (!write_all_fd(socket_, frame.data(), frame.size())) {
            std::cout << "⚠️ Close frame not delivered on socket " << socket_ << std::endl;
        }
    }
    // Wakes the reader thread; the fd itself is closed by the destructor
    shutdown(socket_, SHUT_RDWR);
}

// ---------------------------------------------------------------------------
// WebSocketServer

WebSocketServer::WebSocketServer(ConnectionRegistry& registry, MessageRouter& router,
                                 const std::string& path, size_t max_frame_bytes)
    : registry_(registry), router_(router), path_(path), max_frame_bytes_(max_frame_bytes),
      send_timeout_(5000), server_socket_(-1), bound_port_(0), running_(false) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

bool WebSocketServer::start(int port) {
    if (running_) {
        return true;
    }

    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        std::cerr << "❌ Failed to create socket" << std::endl;
        return false;
    }

    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        std::cerr << "❌ Failed to bind to port " << port << std::endl;
        ::close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 64) < 0) {
        std::cerr << "❌ Failed to listen on socket" << std::endl;
        ::close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    socklen_t len = sizeof(address);
    if (getsockname(server_socket_, (struct sockaddr*)&address, &len) == 0) {
        bound_port_ = ntohs(address.sin_port);
    } else {
        bound_port_ = port;
    }

    running_ = true;
    server_thread_ = std::thread(&WebSocketServer::server_loop, this);
    std::cout << "✅ WebSocket server listening on port " << bound_port_ << " (path " << path_ << ")" << std::endl;
    return true;
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    if (server_socket_ >= 0) {
        ::close(server_socket_);
        server_socket_ = -1;
    }

    registry_.close_all();

    std::unique_lock<std::mutex> lock(clients_mutex_);
    if (!clients_cv_.wait_for(lock, std::chrono::seconds(5), [this] { return active_clients_ == 0; })) {
        std::cout << "⚠️ " << active_clients_ << " client threads still running at shutdown" << std::endl;
    }
    std::cout << "🛑 WebSocket server stopped" << std::endl;
}

size_t WebSocketServer::active_clients() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return active_clients_;
}

void WebSocketServer::server_loop() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = server_socket_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0) {
            continue;
        }

        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &client_len);
        if (client_socket < 0) {
            if (running_) {
                std::cerr << "❌ Failed to accept client connection" << std::endl;
            }
            continue;
        }

        int nodelay = 1;
        setsockopt(client_socket, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            active_clients_++;
        }
        std::thread client_thread(&WebSocketServer::handle_client, this, client_socket);
        client_thread.detach();
    }
}

bool WebSocketServer::parse_handshake(const std::string& raw, HandshakeRequest& request) {
    std::istringstream stream(raw);
    std::string line;
    if (!std::getline(stream, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream request_line(line);
    std::string version;
    request_line >> request.method >> request.path >> version;
    if (request.method.empty() || request.path.empty() || version.compare(0, 5, "HTTP/") != 0) {
        return false;
    }
    size_t query = request.path.find('?');
    if (query != std::string::npos) {
        request.path = request.path.substr(0, query);
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        request.headers[to_lower(trim_copy(line.substr(0, colon)))] = trim_copy(line.substr(colon + 1));
    }
    return true;
}

bool WebSocketServer::perform_handshake(int client_socket, std::string& buffered) {
    char buffer[2048];
    size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
        if (buffered.size() > kMaxHandshakeBytes) {
            return false;
        }
        ssize_t n = recv(client_socket, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return false;
        }
        buffered.append(buffer, static_cast<size_t>(n));
        header_end = buffered.find("\r\n\r\n");
    }

    std::string raw = buffered.substr(0, header_end + 4);
    buffered.erase(0, header_end + 4);

    HandshakeRequest request;
    bool valid = parse_handshake(raw, request);
    std::string key;
    if (valid) {
        auto upgrade = request.headers.find("upgrade");
        auto ws_key = request.headers.find("sec-websocket-key");
        valid = request.method == "GET" && request.path == path_ &&
                upgrade != request.headers.end() && to_lower(upgrade->second) == "websocket" &&
                ws_key != request.headers.end() && !ws_key->second.empty();
        if (valid) key = ws_key->second;
    }

    if (!valid) {
        std::cout << "⚠️ Rejected non-WebSocket request for " << (request.path.empty() ? "?" : request.path) << std::endl;
        const std::string response = "HTTP/1.1 400 Bad Request\r\nContent-Type: text/plain\r\n"
                                     "Content-Length: 11\r\nConnection: close\r\n\r\nBad Request";
        if (!write_all_fd(client_socket, response.data(), response.size()) && verbose_) {
            std::cout << "⚠️ 400 response not delivered" << std::endl;
        }
        return false;
    }

    std::string accept = websocket_accept_key(key);
    if (accept.empty()) {
        std::cerr << "❌ Could not compute Sec-WebSocket-Accept" << std::endl;
        return false;
    }

    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << accept << "\r\n\r\n";
    std::string out = response.str();
    return write_all_fd(client_socket, out.data(), out.size());
}

void WebSocketServer::handle_client(int client_socket) {
    // Bounded wait for the upgrade request only; upgraded sockets block until
    // the peer speaks or the registry closes them
    set_socket_timeout(client_socket, SO_RCVTIMEO, std::chrono::milliseconds(10000));
    set_socket_timeout(client_socket, SO_SNDTIMEO, send_timeout_);

    std::string buffered;
    if (!perform_handshake(client_socket, buffered)) {
        ::close(client_socket);
    } else {
        set_socket_timeout(client_socket, SO_RCVTIMEO, std::chrono::milliseconds(0));

        auto conn = std::make_shared<WebSocketConnection>(client_socket, send_timeout_);
        std::string connection_id = generate_uuid();

        if (!running_) {
            conn->close_with(WS_CLOSE_GOING_AWAY, "server shutting down");
        } else if (!registry_.register_connection(connection_id, conn)) {
            conn->close_with(WS_CLOSE_PROTOCOL_ERROR, "registration failed");
        } else {
            std::cout << "🔌 Client connected: " << connection_id << std::endl;
            nlohmann::json welcome = {
                {"type", "info"},
                {"message", "Connected to relay coordinator"},
                {"connectionId", connection_id}
            };
            registry_.send(connection_id, welcome);

            serve_connection(connection_id, conn, client_socket, buffered);

            registry_.unregister_connection(connection_id);
            conn->close();
            std::cout << "🔌 Client disconnected: " << connection_id << std::endl;
        }
        // conn owns the fd from here and closes it on release
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    active_clients_--;
    clients_cv_.notify_all();
}

void WebSocketServer::serve_connection(const std::string& connection_id,
                                       const std::shared_ptr<WebSocketConnection>& conn,
                                       int client_socket, std::string& buffered) {
    std::string message;
    bool in_fragment = false;

    while (!conn->is_closed()) {
        unsigned char header[2];
        if (!read_buffered(client_socket, buffered, reinterpret_cast<char*>(header), 2)) {
            return;
        }

        bool fin = (header[0] & 0x80) != 0;
        uint8_t opcode = header[0] & 0x0F;
        bool masked = (header[1] & 0x80) != 0;
        uint64_t length = header[1] & 0x7F;

        if (length == 126) {
            unsigned char ext[2];
            if (!read_buffered(client_socket, buffered, reinterpret_cast<char*>(ext), 2)) return;
            length = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
        } else if (length == 127) {
            unsigned char ext[8];
            if (!read_buffered(client_socket, buffered, reinterpret_cast<char*>(ext), 8)) return;
            length = 0;
            for (int i = 0; i < 8; i++) {
                length = (length << 8) | ext[i];
            }
        }

        if (!masked) {
            conn->close_with(WS_CLOSE_PROTOCOL_ERROR, "client frames must be masked");
            return;
        }
        bool control = (opcode & 0x08) != 0;
        if (control && (length > kMaxControlPayload || !fin)) {
            conn->close_with(WS_CLOSE_PROTOCOL_ERROR, "bad control frame");
            return;
        }
        if (length > max_frame_bytes_ || (!control && message.size() + length > max_frame_bytes_)) {
            std::cout << "⚠️ [" << connection_id << "] Frame of " << length << " bytes exceeds limit" << std::endl;
            conn->close_with(WS_CLOSE_TOO_BIG, "message too big");
            return;
        }

        unsigned char mask[4];
        if (!read_buffered(client_socket, buffered, reinterpret_cast<char*>(mask), 4)) return;

        std::string payload(static_cast<size_t>(length), '\0');
        if (length > 0 && !read_buffered(client_socket, buffered, &payload[0], payload.size())) return;
        for (size_t i = 0; i < payload.size(); i++) {
            payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
        }

        switch (opcode) {
            case WS_OP_TEXT:
                if (in_fragment) {
                    conn->close_with(WS_CLOSE_PROTOCOL_ERROR, "expected continuation frame");
                    return;
                }
                if (fin) {
                    router_.handle(connection_id, payload);
                } else {
                    message = std::move(payload);
                    in_fragment = true;
                }
                break;

            case WS_OP_CONTINUATION:
                if (!in_fragment) {
                    conn->close_with(WS_CLOSE_PROTOCOL_ERROR, "unexpected continuation frame");
                    return;
                }
                message += payload;
                if (fin) {
                    router_.handle(connection_id, message);
                    message.clear();
                    in_fragment = false;
                }
                break;

            case WS_OP_BINARY:
                conn->close_with(WS_CLOSE_UNSUPPORTED_DATA, "text frames only");
                return;

            case WS_OP_CLOSE: {
                uint16_t code = WS_CLOSE_NORMAL;
                if (payload.size() >= 2) {
                    code = static_cast<uint16_t>((static_cast<unsigned char>(payload[0]) << 8) |
                                                 static_cast<unsigned char>(payload[1]));
                }
                // 1005/1006/1015 are reserved for local use and never go on the wire
                if (code < 1000 || code == 1004 || code == 1005 || code == 1006 || code == 1015) {
                    code = WS_CLOSE_NORMAL;
                }
                if (verbose_) {
                    std::cout << "🔌 [" << connection_id << "] Close frame, code " << code << std::endl;
                }
                conn->close_with(code);
                return;
            }

            case WS_OP_PING:
                registry_.touch(connection_id);
                if (!conn->send_frame(WS_OP_PONG, payload)) {
                    return;
                }
                break;

            case WS_OP_PONG:
                registry_.touch(connection_id);
                break;

            default:
                conn->close_with(WS_CLOSE_PROTOCOL_ERROR, "unknown opcode");
                return;
        }
    }
}
