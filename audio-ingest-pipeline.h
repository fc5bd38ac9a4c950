#pragma once

#include "call-session.h"
#include "capabilities.h"

#include <string>
#include <memory>
#include <functional>
#include <atomic>
#include <chrono>

class CallSessionStore;
class KeyedExecutor;
class TranscriptionBatchPolicy;

// Buffers call audio and feeds it to the transcription service in batches.
// ingest_audio() runs on the call's ingest queue and never waits for the
// service: attempts run on the capability pool under the key "<call>#stt" and
// their results are merged back through the ingest queue.
class AudioIngestPipeline {
public:
    using DeltaHandler = std::function<void(const CallSession& session, const std::string& delta, bool is_final)>;

    AudioIngestPipeline(CallSessionStore& store, TranscriptionBatchPolicy& policy,
                        KeyedExecutor& ingest, KeyedExecutor& capability,
                        std::shared_ptr<TranscriptionCapability> transcriber,
                        std::chrono::milliseconds timeout);

    CallError ingest_audio(const std::string& call_id, const std::string& fragment);

    // Submits audio not yet transcribed; false when skipped or nothing to send
    bool transcription_attempt(const std::string& call_id);

    // End-of-call: transcribe whatever is left, publish it as final, then run
    // on_done on the call's ingest queue
    void flush(const std::string& call_id, std::function<void()> on_done);

    void set_delta_handler(DeltaHandler handler) { delta_handler_ = std::move(handler); }
    void set_verbose(bool verbose) { verbose_ = verbose; }

    uint64_t attempts_started() const { return attempts_started_.load(); }
    uint64_t attempts_skipped() const { return attempts_skipped_.load(); }
    uint64_t attempts_failed() const { return attempts_failed_.load(); }

    static std::string stt_key(const std::string& call_id) { return call_id + "#stt"; }

private:
    CallSessionStore& store_;
    TranscriptionBatchPolicy& policy_;
    KeyedExecutor& ingest_;
    KeyedExecutor& capability_;
    std::shared_ptr<TranscriptionCapability> transcriber_;
    std::chrono::milliseconds timeout_;

    DeltaHandler delta_handler_;
    bool verbose_ = false;

    std::atomic<uint64_t> attempts_started_{0};
    std::atomic<uint64_t> attempts_skipped_{0};
    std::atomic<uint64_t> attempts_failed_{0};

    CallContext make_context(const std::string& call_id) const;
    void merge_delta(const std::string& call_id, const std::string& text, bool is_final);
};
