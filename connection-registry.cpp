#include "connection-registry.h"

#include <iostream>

ConnectionRegistry::ConnectionRegistry(ClockFn clock)
    : clock_(std::move(clock)) {}

ConnectionRegistry::~ConnectionRegistry() {
    close_all();
}

SystemClock::time_point ConnectionRegistry::now() const {
    return clock_ ? clock_() : SystemClock::now();
}

bool ConnectionRegistry::register_connection(const std::string& id,
                                             std::shared_ptr<MessageTransport> transport,
                                             ConnectionInfo* info) {
    if (id.empty() || !transport) {
        return false;
    }

    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (connections_.count(id)) {
        std::cout << "❌ Connection already registered: " << id << std::endl;
        return false;
    }

    Connection conn;
    conn.info.id = id;
    conn.info.connected_at = now();
    conn.info.last_active = conn.info.connected_at;
    conn.info.is_active = true;
    conn.transport = std::move(transport);

    if (info) *info = conn.info;
    connections_.emplace(id, std::move(conn));
    std::cout << "🔌 Connection registered: " << id << " (" << connections_.size() << " live)" << std::endl;
    return true;
}

void ConnectionRegistry::unregister_connection(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }
        connections_.erase(it);
        std::cout << "🔌 Connection unregistered: " << id << " (" << connections_.size() << " live)" << std::endl;
    }
    notify_disconnect(id);
}

bool ConnectionRegistry::update_metadata(const std::string& id, const nlohmann::json& partial) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        std::cout << "⚠️ Metadata update for unknown connection " << id << std::endl;
        return false;
    }

    if (partial.is_object()) {
        for (auto field = partial.begin(); field != partial.end(); ++field) {
            it->second.info.metadata[field.key()] = field.value();
        }
    }
    it->second.info.last_active = now();
    return true;
}

bool ConnectionRegistry::touch(const std::string& id) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }
    it->second.info.last_active = now();
    return true;
}

bool ConnectionRegistry::send(const std::string& id, const std::string& message) {
    std::shared_ptr<MessageTransport> transport;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            if (verbose_) {
                std::cout << "⚠️ Send to unknown connection " << id << std::endl;
            }
            return false;
        }
        transport = it->second.transport;
    }

    // The write happens outside the registry lock
    if (!transport->send_text(message)) {
        std::cout << "⚠️ Delivery failed to connection " << id << std::endl;
        return false;
    }
    return true;
}

bool ConnectionRegistry::send(const std::string& id, const nlohmann::json& message) {
    return send(id, message.dump());
}

BroadcastResult ConnectionRegistry::broadcast(const nlohmann::json& message) {
    std::vector<std::pair<std::string, std::shared_ptr<MessageTransport>>> targets;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        targets.reserve(connections_.size());
        for (const auto& kv : connections_) {
            targets.emplace_back(kv.first, kv.second.transport);
        }
    }

    const std::string payload = message.dump();
    BroadcastResult result;
    for (const auto& target : targets) {
        if (target.second->send_text(payload)) {
            result.success_count++;
        } else {
            std::cout << "⚠️ Broadcast failed to connection " << target.first << std::endl;
            result.failure_count++;
        }
    }
    return result;
}

std::vector<ConnectionInfo> ConnectionRegistry::list_active() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::vector<ConnectionInfo> out;
    out.reserve(connections_.size());
    for (const auto& kv : connections_) {
        out.push_back(kv.second.info);
    }
    return out;
}

bool ConnectionRegistry::get_connection(const std::string& id, ConnectionInfo& info) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }
    info = it->second.info;
    return true;
}

bool ConnectionRegistry::is_connected(const std::string& id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.count(id) > 0;
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

size_t ConnectionRegistry::evict_inactive(std::chrono::seconds threshold) {
    std::vector<std::pair<std::string, std::shared_ptr<MessageTransport>>> evicted;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        const auto cutoff = now() - threshold;
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->second.info.last_active < cutoff) {
                evicted.emplace_back(it->first, it->second.transport);
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& entry : evicted) {
        entry.second->close();
        std::cout << "🧹 Removed inactive connection: " << entry.first << std::endl;
        notify_disconnect(entry.first);
    }
    return evicted.size();
}

void ConnectionRegistry::close_all() {
    std::vector<std::shared_ptr<MessageTransport>> transports;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& kv : connections_) {
            transports.push_back(kv.second.transport);
        }
    }
    // Entries stay until each connection's reader unregisters itself
    for (auto& t : transports) {
        t->close();
    }
}

void ConnectionRegistry::set_disconnect_handler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    disconnect_handler_ = std::move(handler);
}

void ConnectionRegistry::notify_disconnect(const std::string& id) {
    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = disconnect_handler_;
    }
    if (handler) {
        handler(id);
    }
}
