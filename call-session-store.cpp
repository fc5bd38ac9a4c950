#include "call-session-store.h"

#include <iostream>

CallSessionStore::CallSessionStore(const CallStoreConfig& config, ClockFn clock)
    : config_(config), clock_(std::move(clock)) {}

SystemClock::time_point CallSessionStore::now() const {
    return clock_ ? clock_() : SystemClock::now();
}

std::shared_ptr<CallSessionStore::CallEntry> CallSessionStore::find_entry(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    auto it = calls_.find(call_id);
    if (it == calls_.end()) {
        return nullptr;
    }
    return it->second;
}

void CallSessionStore::emit(SessionListener CallSessionStore::*which, const CallSession& session) {
    SessionListener listener;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listener = this->*which;
    }
    if (listener) {
        listener(session);
    }
}

CallError CallSessionStore::register_call(const std::string& call_id, const std::string& phone_number,
                                          const std::string& device_id, bool is_incoming,
                                          CallSession* session) {
    auto entry = std::make_shared<CallEntry>();
    entry->session.call_id = call_id;
    entry->session.phone_number = phone_number;
    entry->session.device_id = device_id;
    entry->session.is_incoming = is_incoming;
    entry->session.status = CallStatus::Ringing;
    entry->session.started = now();

    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        if (calls_.count(call_id)) {
            std::cout << "❌ Duplicate call registration rejected: " << call_id << std::endl;
            return CallError::Duplicate;
        }
        calls_.emplace(call_id, entry);
    }

    std::cout << "📞 Registered " << (is_incoming ? "incoming" : "outgoing") << " call "
              << (is_incoming ? "from " : "to ") << phone_number << ", ID: " << call_id << std::endl;

    // Nobody else can have touched the entry yet, but go through its lock anyway
    CallSession snapshot;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        snapshot = entry->session;
    }
    if (session) *session = snapshot;

    emit(&CallSessionStore::on_registered_, snapshot);
    emit(&CallSessionStore::on_status_, snapshot);
    return CallError::None;
}

CallError CallSessionStore::update_status(const std::string& call_id, CallStatus status,
                                          CallSession* session) {
    auto entry = find_entry(call_id);
    if (!entry) {
        std::cout << "❌ Status update for unknown call " << call_id << std::endl;
        return CallError::NotFound;
    }

    CallSession snapshot;
    bool finalize = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        CallSession& s = entry->session;
        if (!is_legal_transition(s.status, status)) {
            std::cout << "❌ Illegal transition for call " << call_id << ": "
                      << call_status_name(s.status) << " -> " << call_status_name(status) << std::endl;
            if (session) *session = s;
            return CallError::InvalidTransition;
        }

        s.status = status;
        if (status == CallStatus::Answered) {
            s.answered_at = now();
            s.has_answered = true;
        } else if (status == CallStatus::Ended) {
            s.ended_at = now();
            s.has_ended = true;
            s.duration_s = compute_duration_seconds(s);
            if (!entry->finalize_claimed) {
                entry->finalize_claimed = true;
                finalize = true;
            }
        }
        snapshot = s;
    }

    std::cout << "📞 Call " << call_id << " status updated to " << call_status_name(status);
    if (status == CallStatus::Ended) {
        std::cout << " (duration " << snapshot.duration_s << "s)";
    }
    std::cout << std::endl;

    if (session) *session = snapshot;

    emit(&CallSessionStore::on_status_, snapshot);
    if (finalize) {
        emit(&CallSessionStore::on_ended_, snapshot);
    }
    return CallError::None;
}

CallError CallSessionStore::append_audio(const std::string& call_id, const std::string& fragment,
                                         size_t* fragment_count) {
    auto entry = find_entry(call_id);
    if (!entry) {
        return CallError::NotFound;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->session.status == CallStatus::Ended) {
        return CallError::CallEnded;
    }
    entry->audio.push_back(fragment);
    if (fragment_count) *fragment_count = entry->audio.size();
    return CallError::None;
}

CallError CallSessionStore::get_audio(const std::string& call_id, std::vector<std::string>& fragments) const {
    auto entry = find_entry(call_id);
    if (!entry) {
        return CallError::NotFound;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    fragments = entry->audio;
    return CallError::None;
}

CallError CallSessionStore::pending_audio(const std::string& call_id, std::string& bytes, size_t& upto) const {
    auto entry = find_entry(call_id);
    if (!entry) {
        return CallError::NotFound;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    bytes.clear();
    upto = entry->audio.size();
    for (size_t i = entry->submitted_fragments; i < entry->audio.size(); ++i) {
        bytes += entry->audio[i];
    }
    return CallError::None;
}

void CallSessionStore::mark_audio_submitted(const std::string& call_id, size_t upto) {
    auto entry = find_entry(call_id);
    if (!entry) {
        return;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (upto > entry->submitted_fragments && upto <= entry->audio.size()) {
        entry->submitted_fragments = upto;
    }
}

CallError CallSessionStore::append_transcript(const std::string& call_id, const std::string& delta,
                                              CallSession* session) {
    auto entry = find_entry(call_id);
    if (!entry) {
        return CallError::NotFound;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    std::string& transcript = entry->session.transcript;
    if (!transcript.empty()) transcript += " ";
    transcript += delta;
    if (session) *session = entry->session;
    return CallError::None;
}

CallError CallSessionStore::set_summary(const std::string& call_id, const std::string& summary) {
    auto entry = find_entry(call_id);
    if (!entry) {
        return CallError::NotFound;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.summary = summary;
    entry->session.has_summary = true;
    return CallError::None;
}

bool CallSessionStore::get_call(const std::string& call_id, CallSession& session) const {
    auto entry = find_entry(call_id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    session = entry->session;
    return true;
}

std::vector<CallSession> CallSessionStore::list_active() const {
    std::vector<std::shared_ptr<CallEntry>> entries;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        entries.reserve(calls_.size());
        for (const auto& kv : calls_) {
            entries.push_back(kv.second);
        }
    }

    std::vector<CallSession> out;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->session.status == CallStatus::Ended && entry->audio_discarded) {
            continue;
        }
        out.push_back(entry->session);
    }
    return out;
}

size_t CallSessionStore::size() const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    return calls_.size();
}

CleanupResult CallSessionStore::cleanup_expired() {
    CleanupResult result;
    const auto t = now();

    std::lock_guard<std::mutex> lock(calls_mutex_);
    for (auto it = calls_.begin(); it != calls_.end();) {
        CallEntry& entry = *it->second;
        std::unique_lock<std::mutex> entry_lock(entry.mutex);
        if (entry.session.status != CallStatus::Ended) {
            ++it;
            continue;
        }

        const auto since_end = t - entry.session.ended_at;
        if (!entry.audio_discarded && since_end >= config_.audio_retention) {
            std::vector<std::string>().swap(entry.audio);
            entry.submitted_fragments = 0;
            entry.audio_discarded = true;
            result.audio_discarded++;
            std::cout << "🧹 Discarded audio buffer for ended call " << it->first << std::endl;
        }

        if (since_end >= config_.session_retention) {
            result.sessions_dropped.push_back(it->first);
            entry_lock.unlock();
            std::cout << "🧹 Dropped session metadata for call " << it->first << std::endl;
            it = calls_.erase(it);
            continue;
        }
        ++it;
    }
    return result;
}

void CallSessionStore::set_registered_listener(SessionListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    on_registered_ = std::move(listener);
}

void CallSessionStore::set_status_listener(SessionListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    on_status_ = std::move(listener);
}

void CallSessionStore::set_ended_listener(SessionListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    on_ended_ = std::move(listener);
}
