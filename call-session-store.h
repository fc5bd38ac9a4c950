#pragma once

#include "call-session.h"

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <chrono>

struct CallStoreConfig {
    std::chrono::seconds audio_retention{60};     // audio kept after ended
    std::chrono::seconds session_retention{600};  // metadata kept after ended
};

struct CleanupResult {
    size_t audio_discarded = 0;
    std::vector<std::string> sessions_dropped;
};

// In-memory table of call sessions. The table lock only guards lookups and
// insert/erase; each call has its own lock for state, transcript and audio so
// operations on different calls never contend.
class CallSessionStore {
public:
    using SessionListener = std::function<void(const CallSession& session)>;

    explicit CallSessionStore(const CallStoreConfig& config = CallStoreConfig(), ClockFn clock = nullptr);

    CallError register_call(const std::string& call_id, const std::string& phone_number,
                            const std::string& device_id, bool is_incoming,
                            CallSession* session = nullptr);

    // On the ended transition the duration is computed and the ended listener
    // fires exactly once per call
    CallError update_status(const std::string& call_id, CallStatus status,
                            CallSession* session = nullptr);

    CallError append_audio(const std::string& call_id, const std::string& fragment,
                           size_t* fragment_count = nullptr);
    CallError get_audio(const std::string& call_id, std::vector<std::string>& fragments) const;

    // Audio not yet accepted by the transcription service. The cursor only moves
    // when mark_audio_submitted() confirms a successful attempt.
    CallError pending_audio(const std::string& call_id, std::string& bytes, size_t& upto) const;
    void mark_audio_submitted(const std::string& call_id, size_t upto);

    CallError append_transcript(const std::string& call_id, const std::string& delta,
                                CallSession* session = nullptr);
    CallError set_summary(const std::string& call_id, const std::string& summary);

    bool get_call(const std::string& call_id, CallSession& session) const;
    // Live calls plus ended calls still inside the audio grace window
    std::vector<CallSession> list_active() const;
    size_t size() const;

    CleanupResult cleanup_expired();

    void set_registered_listener(SessionListener listener);
    void set_status_listener(SessionListener listener);
    void set_ended_listener(SessionListener listener);

    const CallStoreConfig& config() const { return config_; }

private:
    struct CallEntry {
        mutable std::mutex mutex;
        CallSession session;
        std::vector<std::string> audio;
        size_t submitted_fragments = 0;
        bool audio_discarded = false;
        bool finalize_claimed = false;
    };

    CallStoreConfig config_;
    ClockFn clock_;

    std::unordered_map<std::string, std::shared_ptr<CallEntry>> calls_;
    mutable std::mutex calls_mutex_;

    SessionListener on_registered_;
    SessionListener on_status_;
    SessionListener on_ended_;
    mutable std::mutex listeners_mutex_;

    SystemClock::time_point now() const;
    std::shared_ptr<CallEntry> find_entry(const std::string& call_id) const;
    void emit(SessionListener CallSessionStore::*which, const CallSession& session);
};
