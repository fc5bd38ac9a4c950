#include "message-router.h"
#include "connection-registry.h"
#include "call-session-store.h"
#include "observer-fanout.h"
#include "audio-ingest-pipeline.h"
#include "keyed-executor.h"
#include "relay-util.h"

#include <iostream>

// Field helpers fill RouteError and return false on the first problem
static bool require_string(const nlohmann::json& obj, const char* field, std::string& out, RouteError& error) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) {
        error.code = "missing_field";
        error.message = std::string("Missing required field '") + field + "'";
        return false;
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        error.code = "invalid_field";
        error.message = std::string("Field '") + field + "' must be a non-empty string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

static bool optional_string(const nlohmann::json& obj, const char* field, std::string& out, RouteError& error) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        error.code = "invalid_field";
        error.message = std::string("Field '") + field + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

static bool optional_bool(const nlohmann::json& obj, const char* field, bool& out, RouteError& error) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_boolean()) {
        error.code = "invalid_field";
        error.message = std::string("Field '") + field + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool parse_inbound_message(const std::string& text, InboundMessage& message, RouteError& error) {
    error = RouteError();

    nlohmann::json obj;
    try {
        obj = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        error.code = "invalid_json";
        error.message = e.what();
        return false;
    }
    if (!obj.is_object()) {
        error.code = "invalid_json";
        error.message = "Message must be a JSON object";
        return false;
    }

    std::string type;
    if (!require_string(obj, "type", type, error)) {
        return false;
    }
    error.request_type = type;

    // Best effort, so errors can echo the call id even when validation fails
    auto cid = obj.find("callId");
    if (cid != obj.end() && cid->is_string()) {
        error.call_id = cid->get<std::string>();
    }

    if (type == "init") {
        InitMessage msg;
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (it.key() != "type") {
                msg.fields[it.key()] = it.value();
            }
        }
        message = std::move(msg);
        return true;
    }

    if (type == "ping") {
        message = PingMessage();
        return true;
    }

    if (type == "call_register") {
        CallRegisterMessage msg;
        if (!require_string(obj, "callId", msg.call_id, error) ||
            !require_string(obj, "phoneNumber", msg.phone_number, error) ||
            !require_string(obj, "deviceId", msg.device_id, error) ||
            !optional_bool(obj, "isIncoming", msg.is_incoming, error)) {
            return false;
        }
        message = std::move(msg);
        return true;
    }

    if (type == "call_status") {
        CallStatusMessage msg;
        std::string status;
        if (!require_string(obj, "callId", msg.call_id, error) ||
            !require_string(obj, "status", status, error)) {
            return false;
        }
        if (!parse_call_status(status, msg.status)) {
            error.code = "invalid_field";
            error.message = "Unknown status '" + status + "'";
            return false;
        }
        message = std::move(msg);
        return true;
    }

    if (type == "call_audio") {
        CallAudioMessage msg;
        std::string encoded;
        if (!require_string(obj, "callId", msg.call_id, error) ||
            !require_string(obj, "audio", encoded, error)) {
            return false;
        }
        if (!base64_decode(encoded, msg.audio) || msg.audio.empty()) {
            error.code = "invalid_field";
            error.message = "Field 'audio' must be non-empty base64";
            return false;
        }
        message = std::move(msg);
        return true;
    }

    if (type == "call_observe") {
        CallObserveMessage msg;
        if (!require_string(obj, "callId", msg.call_id, error)) {
            return false;
        }
        message = std::move(msg);
        return true;
    }

    if (type == "call_unobserve") {
        CallUnobserveMessage msg;
        if (!require_string(obj, "callId", msg.call_id, error)) {
            return false;
        }
        message = std::move(msg);
        return true;
    }

    if (type == "call_command") {
        CallCommandMessage msg;
        if (!require_string(obj, "callId", msg.call_id, error) ||
            !require_string(obj, "command", msg.command, error) ||
            !optional_string(obj, "text", msg.text, error)) {
            return false;
        }
        if (msg.command != "speak" && msg.command != "end_call") {
            error.code = "invalid_field";
            error.message = "Unknown command '" + msg.command + "'";
            return false;
        }
        // Nothing to say is only valid when hanging up
        if (msg.command == "speak" && trim_copy(msg.text).empty()) {
            error.code = "missing_field";
            error.message = "Command 'speak' needs a non-empty 'text'";
            return false;
        }
        message = std::move(msg);
        return true;
    }

    if (type == "call_get") {
        CallGetMessage msg;
        if (!require_string(obj, "callId", msg.call_id, error)) {
            return false;
        }
        message = std::move(msg);
        return true;
    }

    if (type == "calls_list") {
        message = CallsListMessage();
        return true;
    }

    error.code = "unknown_type";
    error.message = "Unknown message type '" + type + "'";
    return false;
}

nlohmann::json make_ack(const std::string& request_type, const std::string& call_id) {
    nlohmann::json ack = {{"type", "ack"}, {"requestType", request_type}};
    if (!call_id.empty()) {
        ack["callId"] = call_id;
    }
    return ack;
}

nlohmann::json make_error_reply(const RouteError& error) {
    nlohmann::json reply = {
        {"type", "error"},
        {"code", error.code},
        {"message", error.message}
    };
    if (!error.request_type.empty()) {
        reply["requestType"] = error.request_type;
    }
    if (!error.call_id.empty()) {
        reply["callId"] = error.call_id;
    }
    return reply;
}

static std::string describe_error(CallError err, const std::string& call_id) {
    switch (err) {
        case CallError::NotFound:          return "Call " + call_id + " not found";
        case CallError::Duplicate:         return "Call " + call_id + " is already registered";
        case CallError::InvalidTransition: return "Illegal status change for call " + call_id;
        case CallError::CallEnded:         return "Call " + call_id + " has already ended";
        case CallError::DeliveryFailure:   return "Device for call " + call_id + " is not connected";
        default:                           return call_error_name(err);
    }
}

MessageRouter::MessageRouter(ConnectionRegistry& registry, CallSessionStore& store, ObserverFanout& fanout,
                             AudioIngestPipeline& audio, KeyedExecutor& ingest, ClockFn clock)
    : registry_(registry), store_(store), fanout_(fanout), audio_(audio), ingest_(ingest),
      clock_(std::move(clock)) {}

void MessageRouter::handle(const std::string& connection_id, const std::string& text) {
    registry_.touch(connection_id);

    InboundMessage message;
    RouteError error;
    if (!parse_inbound_message(text, message, error)) {
        messages_rejected_++;
        std::cout << "⚠️ [" << connection_id << "] Rejected message: " << error.code
                  << " (" << error.message << ")" << std::endl;
        reply(connection_id, make_error_reply(error));
        return;
    }
    messages_handled_++;

    if (auto* msg = std::get_if<InitMessage>(&message)) {
        on_init(connection_id, *msg);
    } else if (auto* msg = std::get_if<CallRegisterMessage>(&message)) {
        on_register(connection_id, *msg);
    } else if (auto* msg = std::get_if<CallStatusMessage>(&message)) {
        on_status(connection_id, *msg);
    } else if (auto* msg = std::get_if<CallAudioMessage>(&message)) {
        on_audio(connection_id, *msg);
    } else if (auto* msg = std::get_if<CallObserveMessage>(&message)) {
        on_observe(connection_id, *msg);
    } else if (auto* msg = std::get_if<CallUnobserveMessage>(&message)) {
        on_unobserve(connection_id, *msg);
    } else if (auto* msg = std::get_if<CallCommandMessage>(&message)) {
        on_command(connection_id, *msg);
    } else if (auto* msg = std::get_if<CallGetMessage>(&message)) {
        on_get(connection_id, *msg);
    } else if (std::holds_alternative<CallsListMessage>(message)) {
        on_list(connection_id);
    } else {
        on_ping(connection_id);
    }
}

void MessageRouter::on_init(const std::string& connection_id, const InitMessage& msg) {
    registry_.update_metadata(connection_id, msg.fields);
    std::cout << "🔌 [" << connection_id << "] Device info: " << msg.fields.dump() << std::endl;
    reply(connection_id, make_ack("init"));
}

void MessageRouter::on_register(const std::string& connection_id, const CallRegisterMessage& msg) {
    // The sending connection owns the call; the reported deviceId is kept as metadata
    dispatch(connection_id, "call_register", msg.call_id, [this, connection_id, msg]() {
        CallError err = store_.register_call(msg.call_id, msg.phone_number, connection_id, msg.is_incoming);
        if (err != CallError::None) {
            reply_error(connection_id, "call_register", msg.call_id, err);
            return;
        }
        registry_.update_metadata(connection_id, {{"deviceId", msg.device_id}});
        reply(connection_id, make_ack("call_register", msg.call_id));
    });
}

void MessageRouter::on_status(const std::string& connection_id, const CallStatusMessage& msg) {
    dispatch(connection_id, "call_status", msg.call_id, [this, connection_id, msg]() {
        CallError err = store_.update_status(msg.call_id, msg.status);
        if (err != CallError::None) {
            reply_error(connection_id, "call_status", msg.call_id, err);
            return;
        }
        reply(connection_id, make_ack("call_status", msg.call_id));
    });
}

void MessageRouter::on_audio(const std::string& connection_id, const CallAudioMessage& msg) {
    dispatch(connection_id, "call_audio", msg.call_id, [this, connection_id, msg]() {
        CallError err = audio_.ingest_audio(msg.call_id, msg.audio);
        if (err != CallError::None) {
            reply_error(connection_id, "call_audio", msg.call_id, err);
        }
    });
}

void MessageRouter::on_observe(const std::string& connection_id, const CallObserveMessage& msg) {
    // Queued behind earlier updates for the call so the snapshot is never stale
    dispatch(connection_id, "call_observe", msg.call_id, [this, connection_id, msg]() {
        if (!registry_.is_connected(connection_id)) {
            return;
        }
        bool added = fanout_.subscribe(msg.call_id, connection_id);
        // Unregistering prunes after removing the entry; if that ran between the
        // check above and the subscribe, take the stale id back out here
        if (!registry_.is_connected(connection_id)) {
            fanout_.unsubscribe(msg.call_id, connection_id);
            return;
        }
        if (added) {
            std::cout << "👀 [" << connection_id << "] Observing call " << msg.call_id << std::endl;
        }
        reply(connection_id, make_ack("call_observe", msg.call_id));

        CallSession session;
        if (store_.get_call(msg.call_id, session)) {
            nlohmann::json snapshot = {
                {"type", "call_update"},
                {"callId", msg.call_id},
                {"call", session_to_json(session)}
            };
            reply(connection_id, snapshot);
        }
    });
}

void MessageRouter::on_unobserve(const std::string& connection_id, const CallUnobserveMessage& msg) {
    dispatch(connection_id, "call_unobserve", msg.call_id, [this, connection_id, msg]() {
        fanout_.unsubscribe(msg.call_id, connection_id);
        reply(connection_id, make_ack("call_unobserve", msg.call_id));
    });
}

void MessageRouter::on_command(const std::string& connection_id, const CallCommandMessage& msg) {
    dispatch(connection_id, "call_command", msg.call_id, [this, connection_id, msg]() {
        CallSession session;
        if (!store_.get_call(msg.call_id, session)) {
            reply_error(connection_id, "call_command", msg.call_id, CallError::NotFound);
            return;
        }

        // Same instruction shape the response pipeline sends to the device
        nlohmann::json instruction = {
            {"type", "call_ai_response"},
            {"callId", msg.call_id},
            {"responseType", msg.command},
            {"text", msg.text}
        };
        if (!registry_.is_connected(session.device_id) || !registry_.send(session.device_id, instruction)) {
            reply_error(connection_id, "call_command", msg.call_id, CallError::DeliveryFailure);
            return;
        }
        std::cout << "💬 [" << msg.call_id << "] Sent " << msg.command << " command to " << session.device_id << std::endl;
        reply(connection_id, make_ack("call_command", msg.call_id));
    });
}

void MessageRouter::on_get(const std::string& connection_id, const CallGetMessage& msg) {
    dispatch(connection_id, "call_get", msg.call_id, [this, connection_id, msg]() {
        CallSession session;
        if (!store_.get_call(msg.call_id, session)) {
            reply_error(connection_id, "call_get", msg.call_id, CallError::NotFound);
            return;
        }
        reply(connection_id, {
            {"type", "call_info"},
            {"callId", msg.call_id},
            {"call", session_to_json(session, true)}
        });
    });
}

void MessageRouter::on_list(const std::string& connection_id) {
    nlohmann::json calls = nlohmann::json::array();
    for (const auto& session : store_.list_active()) {
        calls.push_back(session_to_json(session));
    }
    reply(connection_id, {{"type", "calls_list"}, {"calls", calls}});
}

void MessageRouter::on_ping(const std::string& connection_id) {
    SystemClock::time_point now = clock_ ? clock_() : SystemClock::now();
    reply(connection_id, {{"type", "pong"}, {"timestamp", format_iso8601(now)}});
}

void MessageRouter::reply_error(const std::string& connection_id, const std::string& request_type,
                                const std::string& call_id, CallError err) {
    RouteError error;
    error.request_type = request_type;
    error.call_id = call_id;
    error.code = call_error_name(err);
    error.message = describe_error(err, call_id);
    std::cout << "❌ [" << connection_id << "] " << request_type << " failed: " << error.message << std::endl;
    reply(connection_id, make_error_reply(error));
}

void MessageRouter::reply(const std::string& connection_id, const nlohmann::json& message) {
    if (!registry_.send(connection_id, message) && verbose_) {
        std::cout << "⚠️ [" << connection_id << "] Reply not delivered" << std::endl;
    }
}

bool MessageRouter::dispatch(const std::string& connection_id, const std::string& request_type,
                             const std::string& call_id, std::function<void()> task) {
    if (ingest_.post(call_id, std::move(task))) {
        return true;
    }
    std::cout << "⚠️ [" << connection_id << "] " << request_type << " for " << call_id
              << " dropped, coordinator is shutting down" << std::endl;
    return false;
}
