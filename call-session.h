#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

using SystemClock = std::chrono::system_clock;

// Injectable time source; nullptr means SystemClock::now()
using ClockFn = std::function<SystemClock::time_point()>;

enum class CallStatus {
    Ringing,
    Answered,
    InProgress,
    Ended
};

// Request-level and enrichment failures. Domain operations return one of these
// and hand results back through out-parameters.
enum class CallError {
    None,
    NotFound,
    Duplicate,
    InvalidTransition,
    CallEnded,
    ExternalCapability,
    DeliveryFailure
};

const char* call_status_name(CallStatus status);
bool parse_call_status(const std::string& text, CallStatus& status);

// ringing -> answered -> in_progress, and any non-terminal state -> ended
bool is_legal_transition(CallStatus from, CallStatus to);

// Wire code used in error replies ("not_found", "duplicate", ...)
const char* call_error_name(CallError err);

struct CallSession {
    std::string call_id;
    std::string phone_number;
    std::string device_id;      // owning device connection (weak, by id)
    bool is_incoming = true;
    CallStatus status = CallStatus::Ringing;

    SystemClock::time_point started;
    SystemClock::time_point answered_at;
    SystemClock::time_point ended_at;
    bool has_answered = false;
    bool has_ended = false;

    std::string transcript;
    int64_t duration_s = 0;     // set once, at the ended transition
    std::string summary;
    bool has_summary = false;

    bool is_terminal() const { return status == CallStatus::Ended; }
};

// ended_at - (answered_at ?? started), rounded to whole seconds
int64_t compute_duration_seconds(const CallSession& session);

// Session fields for call_update payloads; the transcript is only included
// when asked for.
nlohmann::json session_to_json(const CallSession& session, bool include_transcript = false);
