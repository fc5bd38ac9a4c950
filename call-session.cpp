#include "call-session.h"
#include "relay-util.h"

const char* call_status_name(CallStatus status) {
    switch (status) {
        case CallStatus::Ringing:    return "ringing";
        case CallStatus::Answered:   return "answered";
        case CallStatus::InProgress: return "in_progress";
        case CallStatus::Ended:      return "ended";
    }
    return "unknown";
}

bool parse_call_status(const std::string& text, CallStatus& status) {
    if (text == "ringing")     { status = CallStatus::Ringing; return true; }
    if (text == "answered")    { status = CallStatus::Answered; return true; }
    if (text == "in_progress") { status = CallStatus::InProgress; return true; }
    if (text == "ended")       { status = CallStatus::Ended; return true; }
    return false;
}

bool is_legal_transition(CallStatus from, CallStatus to) {
    // Ended is terminal; any live call may end
    if (from == CallStatus::Ended) return false;
    if (to == CallStatus::Ended) return true;
    if (from == CallStatus::Ringing && to == CallStatus::Answered) return true;
    if (from == CallStatus::Answered && to == CallStatus::InProgress) return true;
    return false;
}

const char* call_error_name(CallError err) {
    switch (err) {
        case CallError::None:               return "ok";
        case CallError::NotFound:           return "not_found";
        case CallError::Duplicate:          return "duplicate";
        case CallError::InvalidTransition:  return "invalid_transition";
        case CallError::CallEnded:          return "call_ended";
        case CallError::ExternalCapability: return "external_capability";
        case CallError::DeliveryFailure:    return "delivery_failure";
    }
    return "unknown";
}

int64_t compute_duration_seconds(const CallSession& session) {
    // Unanswered calls count from registration, rounded to the nearest second
    SystemClock::time_point from = session.has_answered ? session.answered_at : session.started;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(session.ended_at - from).count();
    if (ms < 0) return 0;
    return (ms + 500) / 1000;
}

nlohmann::json session_to_json(const CallSession& session, bool include_transcript) {
    nlohmann::json j = {
        {"callId", session.call_id},
        {"phoneNumber", session.phone_number},
        {"deviceId", session.device_id},
        {"isIncoming", session.is_incoming},
        {"status", call_status_name(session.status)},
        {"startTime", format_iso8601(session.started)}
    };
    if (session.has_answered) {
        j["answeredAt"] = format_iso8601(session.answered_at);
    }
    if (session.has_ended) {
        j["endedAt"] = format_iso8601(session.ended_at);
        j["duration"] = session.duration_s;
    }
    if (session.has_summary) {
        j["summary"] = session.summary;
    }
    if (include_transcript) {
        j["transcript"] = session.transcript;
    }
    return j;
}
