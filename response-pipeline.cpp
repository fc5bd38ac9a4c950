#include "response-pipeline.h"
#include "call-session-store.h"
#include "connection-registry.h"
#include "observer-fanout.h"
#include "keyed-executor.h"
#include "channel-forwarder.h"
#include "relay-util.h"

#include <iostream>

static const char* kEndCallMarker = "[END_CALL]";

ResponsePipeline::ResponsePipeline(CallSessionStore& store, ConnectionRegistry& registry, ObserverFanout& fanout,
                                   KeyedExecutor& capability, ChannelForwarder& channel,
                                   std::shared_ptr<ResponseCapability> responder,
                                   std::shared_ptr<SummaryCapability> summarizer,
                                   std::chrono::milliseconds timeout)
    : store_(store), registry_(registry), fanout_(fanout), capability_(capability), channel_(channel),
      responder_(std::move(responder)), summarizer_(std::move(summarizer)), timeout_(timeout) {}

bool ResponsePipeline::parse_directive(const std::string& raw, std::string& response_type, std::string& text) {
    std::string trimmed = trim_copy(raw);
    if (trimmed.empty()) {
        return false;
    }

    // A leading [END_CALL] turns the reply into a hangup; any text after it is the goodbye
    const std::string marker = kEndCallMarker;
    if (trimmed.compare(0, marker.size(), marker) == 0) {
        response_type = "end_call";
        text = trim_copy(trimmed.substr(marker.size()));
        return true;
    }

    response_type = "speak";
    text = trimmed;
    return true;
}

void ResponsePipeline::on_transcript_delta(const std::string& call_id, const std::string& delta) {
    if (!responder_) {
        return;
    }
    // One generation at a time per call
    bool posted = capability_.post(ai_key(call_id), [this, call_id, delta]() {
        run_response(call_id, delta);
    });
    if (!posted) {
        std::cout << "⚠️ [" << call_id << "] Response generation dropped during shutdown" << std::endl;
    }
}

void ResponsePipeline::run_response(const std::string& call_id, const std::string& delta) {
    CallSession session;
    if (!store_.get_call(call_id, session)) {
        std::cout << "⚠️ [" << call_id << "] Call gone before response generation" << std::endl;
        return;
    }

    // Snapshot taken outside the store lock; the call may end while the model runs
    CallContext ctx;
    ctx.call_id = call_id;
    ctx.phone_number = session.phone_number;
    ctx.is_incoming = session.is_incoming;
    ctx.in_progress = !session.is_terminal();

    std::string raw;
    if (!responder_->generate_response(delta, ctx, timeout_, raw)) {
        std::cout << "⚠️ [" << call_id << "] Response generation failed, skipping this delta" << std::endl;
        return;
    }

    std::string response_type;
    std::string text;
    if (!parse_directive(raw, response_type, text)) {
        return;
    }
    responses_generated_++;
    std::cout << "💬 [" << call_id << "] " << response_type << ": " << text << std::endl;

    // Device first, then observers
    if (registry_.is_connected(session.device_id)) {
        nlohmann::json instruction = {
            {"type", "call_ai_response"},
            {"callId", call_id},
            {"responseType", response_type},
            {"text", text}
        };
        if (!registry_.send(session.device_id, instruction)) {
            std::cout << "⚠️ [" << call_id << "] Device " << session.device_id << " missed the instruction" << std::endl;
        }
    } else {
        std::cout << "⚠️ [" << call_id << "] Device " << session.device_id << " not connected, observers only" << std::endl;
    }

    fanout_.publish_ai_response(call_id, response_type, text);
}

void ResponsePipeline::finalize(const std::string& call_id) {
    // Same key as responses so the summary waits for in-flight generations
    bool posted = capability_.post(ai_key(call_id), [this, call_id]() {
        run_finalize(call_id);
    });
    if (!posted) {
        std::cout << "⚠️ [" << call_id << "] Finalize dropped during shutdown" << std::endl;
    }
}

void ResponsePipeline::run_finalize(const std::string& call_id) {
    finalizations_++;

    CallSession session;
    if (!store_.get_call(call_id, session)) {
        std::cout << "⚠️ [" << call_id << "] Call gone before finalize" << std::endl;
        return;
    }

    if (trim_copy(session.transcript).empty()) {
        std::cout << "📞 No transcript available for call " << call_id << std::endl;
    } else if (summarizer_) {
        std::cout << "📞 Finalizing call " << call_id << " with transcript length "
                  << session.transcript.size() << std::endl;

        CallContext ctx;
        ctx.call_id = call_id;
        ctx.phone_number = session.phone_number;
        ctx.is_incoming = session.is_incoming;
        ctx.in_progress = false;
        ctx.duration_s = session.duration_s;

        std::string summary;
        if (summarizer_->summarize(session.transcript, ctx, timeout_, summary) && !trim_copy(summary).empty()) {
            summary = trim_copy(summary);
            if (store_.set_summary(call_id, summary) == CallError::None) {
                session.summary = summary;
                session.has_summary = true;
                fanout_.publish_summary(call_id, summary);
                channel_.forward(session, ChannelEvent::CallSummary);
            }
        } else {
            std::cout << "⚠️ [" << call_id << "] Summary generation failed" << std::endl;
        }
    }

    // History write happens even without a summary
    if (finalized_handler_) {
        finalized_handler_(session);
    }
}
