#pragma once

#include "call-session.h"

#include <string>
#include <variant>
#include <functional>
#include <atomic>
#include <nlohmann/json.hpp>

class ConnectionRegistry;
class CallSessionStore;
class ObserverFanout;
class AudioIngestPipeline;
class KeyedExecutor;

struct InitMessage {
    nlohmann::json fields = nlohmann::json::object();   // everything except "type"
};

struct CallRegisterMessage {
    std::string call_id;
    std::string phone_number;
    std::string device_id;
    bool is_incoming = true;
};

struct CallStatusMessage {
    std::string call_id;
    CallStatus status = CallStatus::Ringing;
};

struct CallAudioMessage {
    std::string call_id;
    std::string audio;      // decoded fragment bytes
};

struct CallObserveMessage {
    std::string call_id;
};

struct CallUnobserveMessage {
    std::string call_id;
};

// Operator instruction pushed to the call's owning device
struct CallCommandMessage {
    std::string call_id;
    std::string command;    // "speak" or "end_call"
    std::string text;
};

struct CallGetMessage {
    std::string call_id;
};

struct CallsListMessage {};

struct PingMessage {};

using InboundMessage = std::variant<InitMessage, CallRegisterMessage, CallStatusMessage, CallAudioMessage,
                                    CallObserveMessage, CallUnobserveMessage, CallCommandMessage,
                                    CallGetMessage, CallsListMessage, PingMessage>;

// Structured rejection sent back as {type:"error", requestType, callId?, code, message}
struct RouteError {
    std::string request_type;
    std::string call_id;
    std::string code;
    std::string message;
};

// Validates one text frame into a typed message. Never throws.
bool parse_inbound_message(const std::string& text, InboundMessage& message, RouteError& error);

nlohmann::json make_ack(const std::string& request_type, const std::string& call_id = "");
nlohmann::json make_error_reply(const RouteError& error);

class MessageRouter {
public:
    MessageRouter(ConnectionRegistry& registry, CallSessionStore& store, ObserverFanout& fanout,
                  AudioIngestPipeline& audio, KeyedExecutor& ingest, ClockFn clock = nullptr);

    // Entry point for every inbound text message of a connection
    void handle(const std::string& connection_id, const std::string& text);

    void set_verbose(bool verbose) { verbose_ = verbose; }

    uint64_t messages_handled() const { return messages_handled_.load(); }
    uint64_t messages_rejected() const { return messages_rejected_.load(); }

private:
    ConnectionRegistry& registry_;
    CallSessionStore& store_;
    ObserverFanout& fanout_;
    AudioIngestPipeline& audio_;
    KeyedExecutor& ingest_;
    ClockFn clock_;
    bool verbose_ = false;

    std::atomic<uint64_t> messages_handled_{0};
    std::atomic<uint64_t> messages_rejected_{0};

    void on_init(const std::string& connection_id, const InitMessage& msg);
    void on_register(const std::string& connection_id, const CallRegisterMessage& msg);
    void on_status(const std::string& connection_id, const CallStatusMessage& msg);
    void on_audio(const std::string& connection_id, const CallAudioMessage& msg);
    void on_observe(const std::string& connection_id, const CallObserveMessage& msg);
    void on_unobserve(const std::string& connection_id, const CallUnobserveMessage& msg);
    void on_command(const std::string& connection_id, const CallCommandMessage& msg);
    void on_get(const std::string& connection_id, const CallGetMessage& msg);
    void on_list(const std::string& connection_id);
    void on_ping(const std::string& connection_id);

    void reply_error(const std::string& connection_id, const std::string& request_type,
                     const std::string& call_id, CallError err);
    void reply(const std::string& connection_id, const nlohmann::json& message);
    bool dispatch(const std::string& connection_id, const std::string& request_type,
                  const std::string& call_id, std::function<void()> task);
};
