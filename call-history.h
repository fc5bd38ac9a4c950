#pragma once

#include "call-session.h"

#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

struct CallerRecord {
    int id = 0;
    std::string phone_number;
    std::string created_at;
    std::string last_call;
};

struct CallRecord {
    int id = 0;
    std::string call_id;
    int caller_id = 0;
    std::string device_id;
    std::string phone_number;
    bool is_incoming = true;
    std::string start_time;
    std::string answered_time;
    std::string end_time;
    int64_t duration_s = 0;
    std::string transcription;
    std::string summary;
    std::string status;        // last status seen: ringing, answered, in_progress, ended
};

// Durable call log behind the in-memory store. Writes are best effort: a
// failure is logged and the caller carries on.
class CallHistory {
public:
    CallHistory();
    ~CallHistory();

    bool init(const std::string& db_path = "relay_calls.db");
    void close();
    bool is_open() const { return db_ != nullptr; }

    int get_or_create_caller(const std::string& phone_number);

    bool record_call_started(const CallSession& session);
    // Writes end time, duration, transcript and summary
    bool record_call_finalized(const CallSession& session);

    bool get_call(const std::string& call_id, CallRecord& record);
    std::vector<CallRecord> recent_calls(int limit = 20);

private:
    sqlite3* db_;
    std::mutex db_mutex_;

    bool create_tables();
    int find_or_insert_caller(const std::string& phone_number, const std::string& timestamp);
    static std::string column_text(sqlite3_stmt* stmt, int col);
    static CallRecord read_call_row(sqlite3_stmt* stmt);
};
