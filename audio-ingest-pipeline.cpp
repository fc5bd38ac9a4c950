#include "audio-ingest-pipeline.h"
#include "call-session-store.h"
#include "keyed-executor.h"
#include "transcription-batch-policy.h"
#include "relay-util.h"

#include <iostream>

AudioIngestPipeline::AudioIngestPipeline(CallSessionStore& store, TranscriptionBatchPolicy& policy,
                                         KeyedExecutor& ingest, KeyedExecutor& capability,
                                         std::shared_ptr<TranscriptionCapability> transcriber,
                                         std::chrono::milliseconds timeout)
    : store_(store), policy_(policy), ingest_(ingest), capability_(capability),
      transcriber_(std::move(transcriber)), timeout_(timeout) {}

CallContext AudioIngestPipeline::make_context(const std::string& call_id) const {
    CallContext ctx;
    ctx.call_id = call_id;
    CallSession session;
    if (store_.get_call(call_id, session)) {
        ctx.phone_number = session.phone_number;
        ctx.is_incoming = session.is_incoming;
        ctx.in_progress = !session.is_terminal();
        ctx.duration_s = session.duration_s;
    }
    return ctx;
}

CallError AudioIngestPipeline::ingest_audio(const std::string& call_id, const std::string& fragment) {
    size_t count = 0;
    CallError err = store_.append_audio(call_id, fragment, &count);
    if (err != CallError::None) {
        std::cout << "❌ Audio rejected for call " << call_id << ": " << call_error_name(err) << std::endl;
        return err;
    }

    if (verbose_) {
        std::cout << "🎧 [" << call_id << "] fragment #" << count << " (" << fragment.size() << " bytes)" << std::endl;
    }

    if (policy_.is_due(count)) {
        transcription_attempt(call_id);
    }
    return CallError::None;
}

bool AudioIngestPipeline::transcription_attempt(const std::string& call_id) {
    if (!transcriber_) {
        return false;
    }

    if (!policy_.try_begin(call_id)) {
        attempts_skipped_++;
        std::cout << "⏭️ [" << call_id << "] Transcription still in flight, skipping this batch" << std::endl;
        return false;
    }

    // Everything since the last accepted attempt
    std::string audio;
    size_t upto = 0;
    if (store_.pending_audio(call_id, audio, upto) != CallError::None || audio.empty()) {
        policy_.finish(call_id);
        return false;
    }

    CallContext ctx = make_context(call_id);
    attempts_started_++;
    std::cout << "🎙️ [" << call_id << "] Submitting " << audio.size() << " bytes for transcription" << std::endl;

    bool posted = capability_.post(stt_key(call_id), [this, call_id, audio, upto, ctx]() {
        std::string text;
        auto t0 = std::chrono::steady_clock::now();
        bool ok = transcriber_->transcribe(audio, ctx, timeout_, text);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();

        if (!ok) {
            attempts_failed_++;
            std::cout << "⚠️ [" << call_id << "] Transcription failed after " << ms
                      << "ms, audio kept for the next batch" << std::endl;
            policy_.finish(call_id);
            return;
        }

        // Transcript merges go back through the call's ingest queue
        store_.mark_audio_submitted(call_id, upto);
        text = trim_copy(text);
        if (!text.empty()) {
            merge_delta(call_id, text, false);
        }
        // Released only after the merge is queued so deltas keep their order
        policy_.finish(call_id);
    });

    if (!posted) {
        policy_.finish(call_id);
        return false;
    }
    return true;
}

void AudioIngestPipeline::merge_delta(const std::string& call_id, const std::string& text, bool is_final) {
    bool posted = ingest_.post(call_id, [this, call_id, text, is_final]() {
        CallSession session;
        CallError err = store_.append_transcript(call_id, text, &session);
        if (err != CallError::None) {
            std::cout << "⚠️ [" << call_id << "] Transcript delta dropped: " << call_error_name(err) << std::endl;
            return;
        }
        std::cout << "📝 [" << call_id << "] " << (is_final ? "Final transcript: " : "Transcript: ") << text << std::endl;
        if (delta_handler_) {
            delta_handler_(session, text, is_final);
        }
    });
    if (!posted) {
        std::cout << "⚠️ [" << call_id << "] Transcript delta dropped during shutdown" << std::endl;
    }
}

void AudioIngestPipeline::flush(const std::string& call_id, std::function<void()> on_done) {
    bool posted = capability_.post(stt_key(call_id), [this, call_id, on_done]() {
        std::string text;
        std::string audio;
        size_t upto = 0;
        if (transcriber_ && store_.pending_audio(call_id, audio, upto) == CallError::None && !audio.empty()) {
            CallContext ctx = make_context(call_id);
            attempts_started_++;
            if (transcriber_->transcribe(audio, ctx, timeout_, text)) {
                store_.mark_audio_submitted(call_id, upto);
                text = trim_copy(text);
            } else {
                attempts_failed_++;
                text.clear();
                std::cout << "⚠️ [" << call_id << "] Final transcription failed" << std::endl;
            }
        }

        // Final merge and on_done run in order behind any queued deltas
        bool queued = ingest_.post(call_id, [this, call_id, text, on_done]() {
            if (!text.empty()) {
                CallSession session;
                if (store_.append_transcript(call_id, text, &session) == CallError::None) {
                    std::cout << "📝 [" << call_id << "] Final transcript: " << text << std::endl;
                    if (delta_handler_) {
                        delta_handler_(session, text, true);
                    }
                }
            }
            if (on_done) {
                on_done();
            }
        });
        if (!queued) {
            std::cout << "⚠️ [" << call_id << "] Finalization skipped during shutdown" << std::endl;
        }
    });

    if (!posted) {
        std::cout << "⚠️ [" << call_id << "] Audio flush skipped during shutdown" << std::endl;
    }
}
