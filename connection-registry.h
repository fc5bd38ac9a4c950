#pragma once

#include "call-session.h"

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <chrono>
#include <nlohmann/json.hpp>

// Write side of a live connection. Implementations must tolerate concurrent
// send_text() calls and repeated close() calls.
class MessageTransport {
public:
    virtual ~MessageTransport() = default;
    virtual bool send_text(const std::string& payload) = 0;
    virtual void close() = 0;
};

// Read-only view of a registered connection; never exposes the transport
struct ConnectionInfo {
    std::string id;
    SystemClock::time_point connected_at;
    SystemClock::time_point last_active;
    nlohmann::json metadata = nlohmann::json::object();
    bool is_active = true;
};

struct BroadcastResult {
    size_t success_count = 0;
    size_t failure_count = 0;
};

class ConnectionRegistry {
public:
    using DisconnectHandler = std::function<void(const std::string& connection_id)>;

    explicit ConnectionRegistry(ClockFn clock = nullptr);
    ~ConnectionRegistry();

    // Fails only when the id is already registered
    bool register_connection(const std::string& id, std::shared_ptr<MessageTransport> transport,
                             ConnectionInfo* info = nullptr);
    void unregister_connection(const std::string& id);

    bool update_metadata(const std::string& id, const nlohmann::json& partial);
    bool touch(const std::string& id);

    // Delivery failures are logged and reported as false, never thrown
    bool send(const std::string& id, const std::string& message);
    bool send(const std::string& id, const nlohmann::json& message);
    BroadcastResult broadcast(const nlohmann::json& message);

    std::vector<ConnectionInfo> list_active() const;
    bool get_connection(const std::string& id, ConnectionInfo& info) const;
    bool is_connected(const std::string& id) const;
    size_t size() const;

    size_t evict_inactive(std::chrono::seconds threshold);
    void close_all();

    // Called after a connection leaves the registry (unregister or eviction)
    void set_disconnect_handler(DisconnectHandler handler);

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    struct Connection {
        ConnectionInfo info;
        std::shared_ptr<MessageTransport> transport;
    };

    ClockFn clock_;
    bool verbose_ = false;

    std::unordered_map<std::string, Connection> connections_;
    mutable std::mutex connections_mutex_;

    DisconnectHandler disconnect_handler_;
    std::mutex handler_mutex_;

    SystemClock::time_point now() const;
    void notify_disconnect(const std::string& id);
};
