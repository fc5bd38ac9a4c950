#include "observer-fanout.h"
#include "connection-registry.h"
#include "relay-util.h"

const char* call_event_message_type(CallEventKind kind) {
    switch (kind) {
        case CallEventKind::SessionUpdate:   return "call_update";
        case CallEventKind::TranscriptDelta: return "call_transcript";
        case CallEventKind::AiResponse:      return "call_ai_response";
        case CallEventKind::Summary:         return "call_summary";
    }
    return "call_event";
}

ObserverFanout::ObserverFanout(ConnectionRegistry& registry, ClockFn clock)
    : registry_(registry), clock_(std::move(clock)) {}

std::string ObserverFanout::timestamp() const {
    return format_iso8601(clock_ ? clock_() : SystemClock::now());
}

bool ObserverFanout::subscribe(const std::string& call_id, const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    return observers_[call_id].insert(connection_id).second;
}

bool ObserverFanout::unsubscribe(const std::string& call_id, const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    auto it = observers_.find(call_id);
    if (it == observers_.end()) {
        return false;
    }
    bool removed = it->second.erase(connection_id) > 0;
    if (it->second.empty()) {
        observers_.erase(it);
    }
    return removed;
}

size_t ObserverFanout::prune_connection(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    size_t pruned = 0;
    for (auto it = observers_.begin(); it != observers_.end();) {
        pruned += it->second.erase(connection_id);
        if (it->second.empty()) {
            it = observers_.erase(it);
        } else {
            ++it;
        }
    }
    return pruned;
}

void ObserverFanout::drop_call(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(call_id);
}

std::vector<std::string> ObserverFanout::subscribers(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    auto it = observers_.find(call_id);
    if (it == observers_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

size_t ObserverFanout::publish(const std::string& call_id, CallEventKind kind, const nlohmann::json& payload) {
    // Copy the set so delivery never runs under the observer lock
    std::vector<std::string> targets = subscribers(call_id);
    if (targets.empty()) {
        return 0;
    }

    nlohmann::json message = payload.is_object() ? payload : nlohmann::json::object();
    message["type"] = call_event_message_type(kind);
    message["callId"] = call_id;
    const std::string text = message.dump();

    size_t delivered = 0;
    for (const auto& connection_id : targets) {
        if (registry_.send(connection_id, text)) {
            delivered++;
        }
    }
    return delivered;
}

size_t ObserverFanout::publish_session(const CallSession& session) {
    return publish(session.call_id, CallEventKind::SessionUpdate,
                   {{"call", session_to_json(session, false)}});
}

size_t ObserverFanout::publish_transcript(const std::string& call_id, const std::string& transcript, bool is_final) {
    return publish(call_id, CallEventKind::TranscriptDelta, {
        {"transcript", transcript},
        {"isFinal", is_final},
        {"timestamp", timestamp()}
    });
}

size_t ObserverFanout::publish_ai_response(const std::string& call_id, const std::string& response_type,
                                           const std::string& text) {
    return publish(call_id, CallEventKind::AiResponse, {
        {"responseType", response_type},
        {"text", text},
        {"timestamp", timestamp()}
    });
}

size_t ObserverFanout::publish_summary(const std::string& call_id, const std::string& summary) {
    return publish(call_id, CallEventKind::Summary, {
        {"summary", summary},
        {"timestamp", timestamp()}
    });
}
