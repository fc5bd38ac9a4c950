#include "call-history.h"
#include "relay-util.h"

#include <iostream>

static const char* kCallColumns =
    "id, call_id, caller_id, device_id, phone_number, is_incoming, start_time, answered_time, "
    "end_time, duration_s, transcription, summary, status";

CallHistory::CallHistory() : db_(nullptr) {}

CallHistory::~CallHistory() {
    close();
}

bool CallHistory::init(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "❌ Cannot open call history: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL so readers do not block the finalize writes
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    std::cout << "✅ Call history ready: " << db_path << std::endl;
    return true;
}

void CallHistory::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool CallHistory::create_tables() {
    const char* callers_sql = R"(
        CREATE TABLE IF NOT EXISTS callers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            phone_number TEXT UNIQUE,
            created_at TEXT NOT NULL,
            last_call TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_phone_number ON callers(phone_number);
    )";

    const char* calls_sql = R"(
        CREATE TABLE IF NOT EXISTS calls (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            call_id TEXT UNIQUE NOT NULL,
            caller_id INTEGER,
            device_id TEXT,
            phone_number TEXT,
            is_incoming INTEGER DEFAULT 1,
            start_time TEXT NOT NULL,
            answered_time TEXT,
            end_time TEXT,
            duration_s INTEGER DEFAULT 0,
            transcription TEXT DEFAULT '',
            summary TEXT DEFAULT '',
            status TEXT DEFAULT 'ringing',
            FOREIGN KEY (caller_id) REFERENCES callers(id)
        );
        CREATE INDEX IF NOT EXISTS idx_call_id ON calls(call_id);
        CREATE INDEX IF NOT EXISTS idx_caller_id ON calls(caller_id);
    )";

    // callers first, calls references it
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, callers_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error creating callers table: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }

    rc = sqlite3_exec(db_, calls_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error creating calls table: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

int CallHistory::get_or_create_caller(const std::string& phone_number) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return -1;
    return find_or_insert_caller(phone_number, format_iso8601(SystemClock::now()));
}

int CallHistory::find_or_insert_caller(const std::string& phone_number, const std::string& timestamp) {
    sqlite3_stmt* stmt = nullptr;

    // Existing caller: bump last_call and reuse the id
    const char* select_sql = "SELECT id FROM callers WHERE phone_number = ?";
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, phone_number.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            int caller_id = sqlite3_column_int(stmt, 0);
            sqlite3_finalize(stmt);

            const char* touch_sql = "UPDATE callers SET last_call = ? WHERE id = ?";
            if (sqlite3_prepare_v2(db_, touch_sql, -1, &stmt, nullptr) == SQLITE_OK) {
                sqlite3_bind_text(stmt, 1, timestamp.c_str(), -1, SQLITE_STATIC);
                sqlite3_bind_int(stmt, 2, caller_id);
                if (sqlite3_step(stmt) != SQLITE_DONE) {
                    std::cerr << "⚠️ Could not update last call for caller " << caller_id << std::endl;
                }
            }
            sqlite3_finalize(stmt);
            return caller_id;
        }
    }
    sqlite3_finalize(stmt);
    stmt = nullptr;

    // New caller
    const char* insert_sql = "INSERT INTO callers (phone_number, created_at, last_call) VALUES (?, ?, ?)";
    int caller_id = -1;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, phone_number.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, timestamp.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, timestamp.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_DONE) {
            caller_id = static_cast<int>(sqlite3_last_insert_rowid(db_));
        } else {
            std::cerr << "SQL error creating caller: " << sqlite3_errmsg(db_) << std::endl;
        }
    }
    sqlite3_finalize(stmt);
    return caller_id;
}

bool CallHistory::record_call_started(const CallSession& session) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    std::string start_time = format_iso8601(session.started);
    int caller_id = find_or_insert_caller(session.phone_number, start_time);

    // A repeated start for the same call_id keeps the original row
    const char* sql = "INSERT OR IGNORE INTO calls (call_id, caller_id, device_id, phone_number, is_incoming, "
                      "start_time, status) VALUES (?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    bool success = false;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session.call_id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 2, caller_id);
        sqlite3_bind_text(stmt, 3, session.device_id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, session.phone_number.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 5, session.is_incoming ? 1 : 0);
        sqlite3_bind_text(stmt, 6, start_time.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 7, call_status_name(session.status), -1, SQLITE_STATIC);
        success = sqlite3_step(stmt) == SQLITE_DONE;
    }
    sqlite3_finalize(stmt);

    if (success) {
        std::cout << "📞 Call record created: " << session.call_id << " (caller: " << session.phone_number << ")" << std::endl;
    } else {
        std::cerr << "❌ Failed to record call " << session.call_id << ": " << sqlite3_errmsg(db_) << std::endl;
    }
    return success;
}

bool CallHistory::record_call_finalized(const CallSession& session) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = "UPDATE calls SET answered_time = ?, end_time = ?, duration_s = ?, transcription = ?, "
                      "summary = ?, status = ? WHERE call_id = ?";
    sqlite3_stmt* stmt = nullptr;
    bool success = false;

    // Unset timestamps are stored as NULL
    std::string answered = session.has_answered ? format_iso8601(session.answered_at) : "";
    std::string ended = session.has_ended ? format_iso8601(session.ended_at) : "";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (answered.empty()) sqlite3_bind_null(stmt, 1);
        else sqlite3_bind_text(stmt, 1, answered.c_str(), -1, SQLITE_STATIC);
        if (ended.empty()) sqlite3_bind_null(stmt, 2);
        else sqlite3_bind_text(stmt, 2, ended.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, session.duration_s);
        sqlite3_bind_text(stmt, 4, session.transcript.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, session.summary.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 6, call_status_name(session.status), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 7, session.call_id.c_str(), -1, SQLITE_STATIC);
        // No started row means nothing was updated
        success = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(db_) > 0;
    }
    sqlite3_finalize(stmt);

    if (success) {
        std::cout << "📞 Call record completed: " << session.call_id
                  << " (" << format_duration(session.duration_s) << ")" << std::endl;
    } else {
        std::cerr << "❌ Failed to complete call record " << session.call_id << std::endl;
    }
    return success;
}

std::string CallHistory::column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// Column order follows kCallColumns
CallRecord CallHistory::read_call_row(sqlite3_stmt* stmt) {
    CallRecord record;
    record.id = sqlite3_column_int(stmt, 0);
    record.call_id = column_text(stmt, 1);
    record.caller_id = sqlite3_column_int(stmt, 2);
    record.device_id = column_text(stmt, 3);
    record.phone_number = column_text(stmt, 4);
    record.is_incoming = sqlite3_column_int(stmt, 5) != 0;
    record.start_time = column_text(stmt, 6);
    record.answered_time = column_text(stmt, 7);
    record.end_time = column_text(stmt, 8);
    record.duration_s = sqlite3_column_int64(stmt, 9);
    record.transcription = column_text(stmt, 10);
    record.summary = column_text(stmt, 11);
    record.status = column_text(stmt, 12);
    return record;
}

bool CallHistory::get_call(const std::string& call_id, CallRecord& record) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    std::string sql = std::string("SELECT ") + kCallColumns + " FROM calls WHERE call_id = ?";
    sqlite3_stmt* stmt = nullptr;
    bool found = false;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, call_id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            record = read_call_row(stmt);
            found = true;
        }
    }
    sqlite3_finalize(stmt);
    return found;
}

std::vector<CallRecord> CallHistory::recent_calls(int limit) {
    std::vector<CallRecord> calls;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return calls;

    std::string sql = std::string("SELECT ") + kCallColumns + " FROM calls ORDER BY id DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int(stmt, 1, limit);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            calls.push_back(read_call_row(stmt));
        }
    }
    sqlite3_finalize(stmt);
    return calls;
}
