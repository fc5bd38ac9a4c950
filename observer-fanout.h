#pragma once

#include "call-session.h"

#include <string>
#include <vector>
#include <set>
#include <unordered_map>
#include <mutex>
#include <nlohmann/json.hpp>

class ConnectionRegistry;

enum class CallEventKind {
    SessionUpdate,      // call_update
    TranscriptDelta,    // call_transcript
    AiResponse,         // call_ai_response
    Summary             // call_summary
};

const char* call_event_message_type(CallEventKind kind);

// Per-call observer sets. Holds connection ids only; delivery goes through the
// registry and is best effort.
class ObserverFanout {
public:
    explicit ObserverFanout(ConnectionRegistry& registry, ClockFn clock = nullptr);

    // Both return true when the set actually changed
    bool subscribe(const std::string& call_id, const std::string& connection_id);
    bool unsubscribe(const std::string& call_id, const std::string& connection_id);

    // Removes a departed connection from every call it observed
    size_t prune_connection(const std::string& connection_id);
    void drop_call(const std::string& call_id);

    std::vector<std::string> subscribers(const std::string& call_id) const;

    // Sends {type, callId, ...payload} to each subscriber, returns deliveries
    size_t publish(const std::string& call_id, CallEventKind kind, const nlohmann::json& payload);

    size_t publish_session(const CallSession& session);
    size_t publish_transcript(const std::string& call_id, const std::string& transcript, bool is_final);
    size_t publish_ai_response(const std::string& call_id, const std::string& response_type,
                               const std::string& text);
    size_t publish_summary(const std::string& call_id, const std::string& summary);

private:
    ConnectionRegistry& registry_;
    ClockFn clock_;

    std::unordered_map<std::string, std::set<std::string>> observers_;
    mutable std::mutex observers_mutex_;

    std::string timestamp() const;
};
