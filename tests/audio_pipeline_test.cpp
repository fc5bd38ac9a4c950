#include "coordinator-context.h"
#include "test-support.h"

#include <memory>

struct PipelineRig {
    std::shared_ptr<FakeTranscriber> transcriber = std::make_shared<FakeTranscriber>();
    std::shared_ptr<FakeResponder> responder = std::make_shared<FakeResponder>();
    std::shared_ptr<FakeSummarizer> summarizer = std::make_shared<FakeSummarizer>();
    std::shared_ptr<FakeNotifier> notifier = std::make_shared<FakeNotifier>();
    std::shared_ptr<FakeTransport> observer = std::make_shared<FakeTransport>();
    std::unique_ptr<CoordinatorContext> ctx;

    explicit PipelineRig(size_t batch) {
        CoordinatorConfig config;
        config.batch_threshold = batch;
        config.ingest_workers = 2;
        config.capability_workers = 2;
        CoordinatorCapabilities caps;
        caps.transcriber = transcriber;
        caps.responder = responder;
        caps.summarizer = summarizer;
        caps.notifier = notifier;
        ctx.reset(new CoordinatorContext(config, caps));
        ctx->start(false);
        ctx->registry().register_connection("observer", observer);
    }

    void add_call(const std::string& call_id) {
        ctx->store().register_call(call_id, "+15551234567", "device", true);
        ctx->fanout().subscribe(call_id, "observer");
    }

    CallError ingest(const std::string& call_id, const std::string& fragment) {
        return ctx->audio().ingest_audio(call_id, fragment);
    }

    void settle() { CHECK(ctx->wait_idle_for(std::chrono::milliseconds(5000))); }
};

static void test_batch_policy() {
    std::cout << "\n=== batch policy ===" << std::endl;
    TranscriptionBatchPolicy policy(20);
    CHECK(!policy.is_due(0));
    CHECK(!policy.is_due(1));
    CHECK(!policy.is_due(19));
    CHECK(policy.is_due(20));
    CHECK(!policy.is_due(21));
    CHECK(policy.is_due(40));

    CHECK(policy.try_begin("c1"));
    CHECK(!policy.try_begin("c1"));
    CHECK(policy.try_begin("c2"));
    CHECK(policy.is_outstanding("c1"));
    policy.finish("c1");
    CHECK(!policy.is_outstanding("c1"));
    CHECK(policy.try_begin("c1"));

    TranscriptionBatchPolicy disabled(0);
    CHECK(!disabled.is_due(20));
    CHECK(!disabled.is_due(1));
}

static void test_nineteen_then_twenty() {
    std::cout << "\n=== 19 fragments: nothing, 20th: one attempt ===" << std::endl;
    PipelineRig rig(20);
    rig.add_call("c1");

    for (int i = 0; i < 19; ++i) {
        CHECK(rig.ingest("c1", "x") == CallError::None);
    }
    rig.settle();
    CHECK(rig.transcriber->calls() == 0);
    CHECK(rig.ctx->audio().attempts_started() == 0);

    CHECK(rig.ingest("c1", "x") == CallError::None);
    rig.settle();
    CHECK(rig.transcriber->calls() == 1);
    auto inputs = rig.transcriber->inputs();
    CHECK(inputs.size() == 1 && inputs[0].size() == 20);

    auto contexts = rig.transcriber->contexts();
    CHECK(contexts.size() == 1 && contexts[0].phone_number == "+15551234567" && contexts[0].in_progress);

    CallSession session;
    CHECK(rig.ctx->store().get_call("c1", session));
    CHECK(session.transcript == "chunk-1");
    auto deltas = rig.observer->of_type("call_transcript");
    CHECK(deltas.size() == 1 && deltas[0]["transcript"] == "chunk-1" && deltas[0]["isFinal"] == false);
}

static void test_unknown_call() {
    std::cout << "\n=== audio for an unknown call ===" << std::endl;
    PipelineRig rig(20);
    CHECK(rig.ingest("ghost", "x") == CallError::NotFound);
}

static void test_outstanding_attempt_is_skipped() {
    std::cout << "\n=== attempt in flight: next due batch is skipped ===" << std::endl;
    PipelineRig rig(2);
    rig.add_call("c1");
    rig.transcriber->hold();

    rig.ingest("c1", "a");
    rig.ingest("c1", "b");
    CHECK(rig.transcriber->wait_in_flight());

    // Ingestion is not blocked by the attempt in flight
    rig.ingest("c1", "c");
    rig.ingest("c1", "d");
    CHECK(rig.ctx->audio().attempts_skipped() == 1);
    CHECK(rig.transcriber->calls() == 1);

    rig.transcriber->release();
    rig.settle();
    CHECK(rig.transcriber->calls() == 1);

    rig.ingest("c1", "e");
    rig.ingest("c1", "f");
    rig.settle();

    auto inputs = rig.transcriber->inputs();
    CHECK(inputs.size() == 2);
    if (inputs.size() == 2) {
        CHECK(inputs[0] == "ab");
        CHECK(inputs[1] == "cdef");
    }
    CallSession session;
    rig.ctx->store().get_call("c1", session);
    CHECK(session.transcript == "chunk-1 chunk-2");
}

static void test_failed_attempt_keeps_audio() {
    std::cout << "\n=== failed transcription retries with the same audio ===" << std::endl;
    PipelineRig rig(2);
    rig.add_call("c1");

    rig.transcriber->set_fail(true);
    rig.ingest("c1", "a");
    rig.ingest("c1", "b");
    rig.settle();
    CHECK(rig.ctx->audio().attempts_failed() == 1);

    CallSession session;
    rig.ctx->store().get_call("c1", session);
    CHECK(session.transcript.empty());
    CHECK(rig.observer->of_type("call_transcript").empty());

    rig.transcriber->set_fail(false);
    rig.ingest("c1", "c");
    rig.ingest("c1", "d");
    rig.settle();
    auto inputs = rig.transcriber->inputs();
    CHECK(inputs.size() == 2 && inputs[1] == "abcd");
    rig.ctx->store().get_call("c1", session);
    CHECK(session.transcript == "chunk-2");
}

static void test_deltas_keep_fragment_order() {
    std::cout << "\n=== transcript follows fragment order across calls ===" << std::endl;
    PipelineRig rig(1);
    rig.add_call("c1");
    rig.add_call("c2");

    for (int i = 0; i < 10; ++i) {
        rig.ingest("c1", "p" + std::to_string(i));
        rig.ingest("c2", "q" + std::to_string(i));
        rig.settle();
    }

    auto inputs = rig.transcriber->inputs();
    std::string c1_audio;
    std::string c2_audio;
    for (const auto& in : inputs) {
        if (!in.empty() && in[0] == 'p') c1_audio += in;
        if (!in.empty() && in[0] == 'q') c2_audio += in;
    }
    CHECK(c1_audio == "p0p1p2p3p4p5p6p7p8p9");
    CHECK(c2_audio == "q0q1q2q3q4q5q6q7q8q9");
}

static void test_flush_at_end() {
    std::cout << "\n=== ended call: remaining audio is final, then summary ===" << std::endl;
    PipelineRig rig(20);
    rig.add_call("c1");
    rig.transcriber->set_reply("thanks for calling");

    for (int i = 0; i < 3; ++i) rig.ingest("c1", "z");
    CHECK(rig.ctx->store().update_status("c1", CallStatus::Ended) == CallError::None);
    rig.settle();

    CHECK(rig.transcriber->calls() == 1);
    auto deltas = rig.observer->of_type("call_transcript");
    CHECK(deltas.size() == 1);
    if (!deltas.empty()) {
        CHECK(deltas[0]["isFinal"] == true);
        CHECK(deltas[0]["transcript"] == "thanks for calling");
    }
    // No conversational reply to the final delta
    CHECK(rig.responder->prompts().empty());

    CHECK(rig.summarizer->calls() == 1);
    auto transcripts = rig.summarizer->transcripts();
    CHECK(!transcripts.empty() && transcripts[0] == "thanks for calling");
    CHECK(rig.observer->of_type("call_summary").size() == 1);

    CHECK(rig.ingest("c1", "late") == CallError::CallEnded);
}

static void test_disabled_batching_only_flushes() {
    std::cout << "\n=== batch 0 transcribes once, at the end ===" << std::endl;
    PipelineRig rig(0);
    rig.add_call("c1");
    for (int i = 0; i < 50; ++i) rig.ingest("c1", "y");
    rig.settle();
    CHECK(rig.transcriber->calls() == 0);

    rig.ctx->store().update_status("c1", CallStatus::Ended);
    rig.settle();
    CHECK(rig.transcriber->calls() == 1);
    auto inputs = rig.transcriber->inputs();
    CHECK(!inputs.empty() && inputs[0].size() == 50);
}

int main() {
    test_batch_policy();
    test_nineteen_then_twenty();
    test_unknown_call();
    test_outstanding_attempt_is_skipped();
    test_failed_attempt_keeps_audio();
    test_deltas_keep_fragment_order();
    test_flush_at_end();
    test_disabled_batching_only_flushes();
    return finish_tests("audio_pipeline_test");
}
