#pragma once

#include "call-session.h"
#include "capabilities.h"

#include <string>
#include <memory>
#include <functional>
#include <atomic>
#include <chrono>

class CallSessionStore;
class ConnectionRegistry;
class ObserverFanout;
class KeyedExecutor;
class ChannelForwarder;

// Turns transcript deltas into device instructions and builds the end-of-call
// summary. All work for one call runs under the key "<call>#ai", so responses
// come out in delta order and the summary comes after the last response.
class ResponsePipeline {
public:
    using FinalizedHandler = std::function<void(const CallSession& session)>;

    ResponsePipeline(CallSessionStore& store, ConnectionRegistry& registry, ObserverFanout& fanout,
                     KeyedExecutor& capability, ChannelForwarder& channel,
                     std::shared_ptr<ResponseCapability> responder,
                     std::shared_ptr<SummaryCapability> summarizer,
                     std::chrono::milliseconds timeout);

    void on_transcript_delta(const std::string& call_id, const std::string& delta);
    void finalize(const std::string& call_id);

    // Runs after every finalize, summary or not
    void set_finalized_handler(FinalizedHandler handler) { finalized_handler_ = std::move(handler); }

    uint64_t responses_generated() const { return responses_generated_.load(); }
    uint64_t finalizations() const { return finalizations_.load(); }

    // "[END_CALL] text" -> end_call, other non-blank text -> speak,
    // blank -> false (not actionable)
    static bool parse_directive(const std::string& raw, std::string& response_type, std::string& text);

    static std::string ai_key(const std::string& call_id) { return call_id + "#ai"; }

private:
    CallSessionStore& store_;
    ConnectionRegistry& registry_;
    ObserverFanout& fanout_;
    KeyedExecutor& capability_;
    ChannelForwarder& channel_;
    std::shared_ptr<ResponseCapability> responder_;
    std::shared_ptr<SummaryCapability> summarizer_;
    std::chrono::milliseconds timeout_;

    FinalizedHandler finalized_handler_;

    std::atomic<uint64_t> responses_generated_{0};
    std::atomic<uint64_t> finalizations_{0};

    void run_response(const std::string& call_id, const std::string& delta);
    void run_finalize(const std::string& call_id);
};
