#include "coordinator-context.h"
#include "relay-util.h"
#include "test-support.h"

#include <condition_variable>
#include <memory>
#include <mutex>

struct RouterRig {
    ManualClock clock;
    std::shared_ptr<FakeTranscriber> transcriber = std::make_shared<FakeTranscriber>();
    std::shared_ptr<FakeTransport> device = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeTransport> observer = std::make_shared<FakeTransport>();
    std::unique_ptr<CoordinatorContext> ctx;

    RouterRig() {
        CoordinatorConfig config;
        config.batch_threshold = 20;
        CoordinatorCapabilities caps;
        caps.transcriber = transcriber;
        ctx.reset(new CoordinatorContext(config, caps, clock.fn()));
        ctx->start(false);
        ctx->registry().register_connection("dev", device);
        ctx->registry().register_connection("obs", observer);
    }

    void send(const std::string& from, const nlohmann::json& msg) {
        ctx->router().handle(from, msg.dump());
    }

    void settle() { CHECK(ctx->wait_idle_for(std::chrono::milliseconds(5000))); }

    nlohmann::json last_error(const FakeTransport& t) {
        auto errors = t.of_type("error");
        return errors.empty() ? nlohmann::json() : errors.back();
    }
};

static void test_parse_rejections() {
    std::cout << "\n=== malformed input gets structured errors ===" << std::endl;
    InboundMessage msg;
    RouteError err;

    CHECK(!parse_inbound_message("{not json", msg, err));
    CHECK(err.code == "invalid_json");
    CHECK(!parse_inbound_message("[1,2,3]", msg, err));
    CHECK(err.code == "invalid_json");
    CHECK(!parse_inbound_message("{\"callId\":\"c1\"}", msg, err));
    CHECK(err.code == "missing_field");
    CHECK(!parse_inbound_message("{\"type\":42}", msg, err));
    CHECK(err.code == "invalid_field");
    CHECK(!parse_inbound_message("{\"type\":\"sms_received\"}", msg, err));
    CHECK(err.code == "unknown_type" && err.request_type == "sms_received");

    CHECK(!parse_inbound_message("{\"type\":\"call_register\",\"callId\":\"c1\",\"deviceId\":\"d\"}", msg, err));
    CHECK(err.code == "missing_field" && err.call_id == "c1" && err.message.find("phoneNumber") != std::string::npos);
    CHECK(!parse_inbound_message(
        "{\"type\":\"call_register\",\"callId\":\"c1\",\"phoneNumber\":\"+1\",\"deviceId\":\"d\",\"isIncoming\":\"yes\"}",
        msg, err));
    CHECK(err.code == "invalid_field");

    CHECK(!parse_inbound_message("{\"type\":\"call_status\",\"callId\":\"c1\",\"status\":\"on_hold\"}", msg, err));
    CHECK(err.code == "invalid_field");
    CHECK(!parse_inbound_message("{\"type\":\"call_audio\",\"callId\":\"c1\",\"audio\":\"@@@\"}", msg, err));
    CHECK(err.code == "invalid_field");
    CHECK(!parse_inbound_message("{\"type\":\"call_observe\"}", msg, err));
    CHECK(err.code == "missing_field");
}

static void test_parse_accepts() {
    std::cout << "\n=== well-formed messages become typed variants ===" << std::endl;
    InboundMessage msg;
    RouteError err;

    CHECK(parse_inbound_message(
        "{\"type\":\"call_register\",\"callId\":\"c1\",\"phoneNumber\":\"+1555\",\"deviceId\":\"d1\"}", msg, err));
    auto* reg = std::get_if<CallRegisterMessage>(&msg);
    CHECK(reg != nullptr);
    if (reg) {
        CHECK(reg->call_id == "c1" && reg->phone_number == "+1555" && reg->device_id == "d1");
        CHECK(reg->is_incoming);
    }

    CHECK(parse_inbound_message("{\"type\":\"call_status\",\"callId\":\"c1\",\"status\":\"in_progress\"}", msg, err));
    auto* st = std::get_if<CallStatusMessage>(&msg);
    CHECK(st != nullptr && st->status == CallStatus::InProgress);

    std::string audio_b64 = base64_encode(std::string("\x01\x02\x03\x04", 4));
    CHECK(parse_inbound_message("{\"type\":\"call_audio\",\"callId\":\"c1\",\"audio\":\"" + audio_b64 + "\"}", msg, err));
    auto* au = std::get_if<CallAudioMessage>(&msg);
    CHECK(au != nullptr && au->audio == std::string("\x01\x02\x03\x04", 4));

    CHECK(parse_inbound_message("{\"type\":\"init\",\"model\":\"Pixel\",\"sdk\":34}", msg, err));
    auto* init = std::get_if<InitMessage>(&msg);
    CHECK(init != nullptr && init->fields.size() == 2 && !init->fields.contains("type"));

    CHECK(parse_inbound_message("{\"type\":\"ping\"}", msg, err));
    CHECK(std::holds_alternative<PingMessage>(msg));
}

static void test_register_status_audio_flow() {
    std::cout << "\n=== register, status and audio through the router ===" << std::endl;
    RouterRig rig;

    rig.send("dev", {{"type", "call_register"}, {"callId", "c1"}, {"phoneNumber", "+15551234567"},
                     {"deviceId", "phone-1"}, {"isIncoming", true}});
    rig.settle();
    auto acks = rig.device->of_type("ack");
    CHECK(acks.size() == 1 && acks[0]["requestType"] == "call_register" && acks[0]["callId"] == "c1");

    CallSession session;
    CHECK(rig.ctx->store().get_call("c1", session));
    CHECK(session.device_id == "dev");
    ConnectionInfo info;
    CHECK(rig.ctx->registry().get_connection("dev", info) && info.metadata["deviceId"] == "phone-1");

    rig.send("dev", {{"type", "call_register"}, {"callId", "c1"}, {"phoneNumber", "+1999"}, {"deviceId", "x"}});
    rig.settle();
    CHECK(rig.last_error(*rig.device)["code"] == "duplicate");
    rig.ctx->store().get_call("c1", session);
    CHECK(session.phone_number == "+15551234567");

    rig.send("dev", {{"type", "call_status"}, {"callId", "c1"}, {"status", "in_progress"}});
    rig.settle();
    CHECK(rig.last_error(*rig.device)["code"] == "invalid_transition");

    rig.send("dev", {{"type", "call_status"}, {"callId", "nope"}, {"status", "answered"}});
    rig.settle();
    CHECK(rig.last_error(*rig.device)["code"] == "not_found");

    rig.device->clear();
    rig.send("dev", {{"type", "call_status"}, {"callId", "c1"}, {"status", "answered"}});
    std::string pcm(320, '\0');
    for (int i = 0; i < 20; ++i) {
        rig.send("dev", {{"type", "call_audio"}, {"callId", "c1"}, {"audio", base64_encode(pcm)}});
    }
    rig.settle();
    CHECK(rig.device->of_type("ack").size() == 1);
    CHECK(rig.device->of_type("error").empty());
    CHECK(rig.transcriber->calls() == 1);

    rig.send("dev", {{"type", "call_status"}, {"callId", "c1"}, {"status", "ended"}});
    rig.send("dev", {{"type", "call_audio"}, {"callId", "c1"}, {"audio", base64_encode(pcm)}});
    rig.settle();
    CHECK(rig.last_error(*rig.device)["code"] == "call_ended");
    CHECK(rig.last_error(*rig.device)["requestType"] == "call_audio");
}

static void test_burst_keeps_arrival_order() {
    std::cout << "\n=== one call's messages apply in arrival order ===" << std::endl;
    RouterRig rig;
    rig.send("dev", {{"type", "call_register"}, {"callId", "c2"}, {"phoneNumber", "+1"}, {"deviceId", "d"}});
    rig.send("dev", {{"type", "call_status"}, {"callId", "c2"}, {"status", "answered"}});
    rig.send("dev", {{"type", "call_status"}, {"callId", "c2"}, {"status", "in_progress"}});
    for (int i = 0; i < 5; ++i) {
        rig.send("dev", {{"type", "call_audio"}, {"callId", "c2"}, {"audio", base64_encode("abcd")}});
    }
    rig.send("dev", {{"type", "call_status"}, {"callId", "c2"}, {"status", "ended"}});
    rig.settle();

    CHECK(rig.device->of_type("error").empty());
    CHECK(rig.device->of_type("ack").size() == 4);
    CallSession session;
    CHECK(rig.ctx->store().get_call("c2", session) && session.status == CallStatus::Ended);
    std::vector<std::string> fragments;
    rig.ctx->store().get_audio("c2", fragments);
    CHECK(fragments.size() == 5);
}

static void test_observe_and_unobserve() {
    std::cout << "\n=== observers get a snapshot and then live updates ===" << std::endl;
    RouterRig rig;
    rig.send("dev", {{"type", "call_register"}, {"callId", "c3"}, {"phoneNumber", "+1"}, {"deviceId", "d"}});
    rig.settle();

    rig.send("obs", {{"type", "call_observe"}, {"callId", "c3"}});
    rig.settle();
    auto acks = rig.observer->of_type("ack");
    CHECK(acks.size() == 1 && acks[0]["requestType"] == "call_observe");
    auto updates = rig.observer->of_type("call_update");
    CHECK(updates.size() == 1 && updates[0]["call"]["status"] == "ringing");

    rig.send("dev", {{"type", "call_status"}, {"callId", "c3"}, {"status", "answered"}});
    rig.settle();
    updates = rig.observer->of_type("call_update");
    CHECK(updates.size() == 2 && updates[1]["call"]["status"] == "answered");

    rig.send("obs", {{"type", "call_unobserve"}, {"callId", "c3"}});
    rig.send("dev", {{"type", "call_status"}, {"callId", "c3"}, {"status", "ended"}});
    rig.settle();
    CHECK(rig.observer->of_type("call_update").size() == 2);
    CHECK(rig.observer->of_type("ack").size() == 2);
}

static void test_init_ping_and_touch() {
    std::cout << "\n=== init metadata, ping, activity refresh ===" << std::endl;
    RouterRig rig;
    rig.clock.advance(std::chrono::minutes(5));

    rig.send("dev", {{"type", "init"}, {"model", "Pixel 8"}, {"appVersion", "2.3"}});
    rig.settle();
    ConnectionInfo info;
    CHECK(rig.ctx->registry().get_connection("dev", info));
    CHECK(info.metadata["model"] == "Pixel 8" && info.metadata["appVersion"] == "2.3");
    CHECK(rig.device->of_type("ack").size() == 1);

    rig.clock.advance(std::chrono::minutes(5));
    rig.ctx->router().handle("dev", "garbage");
    CHECK(rig.ctx->registry().get_connection("dev", info) && info.last_active == rig.clock.now());
    CHECK(rig.last_error(*rig.device)["code"] == "invalid_json");

    rig.send("dev", {{"type", "ping"}});
    auto pongs = rig.device->of_type("pong");
    CHECK(pongs.size() == 1 && pongs[0]["timestamp"] == format_iso8601(rig.clock.now()));

    rig.send("dev", {{"type", "sms_received"}});
    auto err = rig.last_error(*rig.device);
    CHECK(err["code"] == "unknown_type" && err["requestType"] == "sms_received");
    CHECK(rig.ctx->router().messages_rejected() == 2);
}

static void test_observe_from_departed_connection() {
    std::cout << "\n=== observe queued behind a disconnect leaves no subscriber ===" << std::endl;
    RouterRig rig;

    // Park the call's queue inside the registration
    std::mutex latch_mutex;
    std::condition_variable latch_cv;
    bool entered = false;
    bool released = false;
    rig.ctx->store().set_registered_listener([&](const CallSession&) {
        std::unique_lock<std::mutex> lock(latch_mutex);
        entered = true;
        latch_cv.notify_all();
        latch_cv.wait(lock, [&] { return released; });
    });

    rig.send("dev", {{"type", "call_register"}, {"callId", "cX"}, {"phoneNumber", "+1"}, {"deviceId", "d"}});
    {
        std::unique_lock<std::mutex> lock(latch_mutex);
        CHECK(latch_cv.wait_for(lock, std::chrono::seconds(3), [&] { return entered; }));
    }

    rig.send("obs", {{"type", "call_observe"}, {"callId", "cX"}});
    rig.ctx->registry().unregister_connection("obs");
    {
        std::lock_guard<std::mutex> lock(latch_mutex);
        released = true;
    }
    latch_cv.notify_all();
    rig.settle();

    CHECK(rig.ctx->fanout().subscribers("cX").empty());
    CHECK(rig.observer->of_type("ack").empty());

    // Same for a call id that never gets registered
    auto late = std::make_shared<FakeTransport>();
    rig.ctx->registry().register_connection("late", late);
    rig.ctx->registry().unregister_connection("late");
    rig.send("late", {{"type", "call_observe"}, {"callId", "never-registered"}});
    rig.settle();
    CHECK(rig.ctx->fanout().subscribers("never-registered").empty());
}

static void test_operator_command() {
    std::cout << "\n=== call_command reaches the owning device ===" << std::endl;
    RouterRig rig;
    auto op = std::make_shared<FakeTransport>();
    rig.ctx->registry().register_connection("op", op);

    rig.send("dev", {{"type", "call_register"}, {"callId", "c5"}, {"phoneNumber", "+1"}, {"deviceId", "d"}});
    rig.settle();

    rig.send("op", {{"type", "call_command"}, {"callId", "c5"}, {"command", "speak"}, {"text", "Please hold"}});
    rig.settle();
    auto to_device = rig.device->of_type("call_ai_response");
    CHECK(to_device.size() == 1);
    if (!to_device.empty()) {
        CHECK(to_device[0]["callId"] == "c5");
        CHECK(to_device[0]["responseType"] == "speak");
        CHECK(to_device[0]["text"] == "Please hold");
    }
    auto acks = op->of_type("ack");
    CHECK(acks.size() == 1 && acks[0]["requestType"] == "call_command");

    rig.send("op", {{"type", "call_command"}, {"callId", "c5"}, {"command", "end_call"}});
    rig.settle();
    to_device = rig.device->of_type("call_ai_response");
    CHECK(to_device.size() == 2 && to_device[1]["responseType"] == "end_call" && to_device[1]["text"] == "");

    rig.send("op", {{"type", "call_command"}, {"callId", "nope"}, {"command", "speak"}, {"text", "hi"}});
    rig.settle();
    CHECK(rig.last_error(*op)["code"] == "not_found");

    rig.send("op", {{"type", "call_command"}, {"callId", "c5"}, {"command", "transfer"}, {"text", "x"}});
    CHECK(rig.last_error(*op)["code"] == "invalid_field");
    rig.send("op", {{"type", "call_command"}, {"callId", "c5"}, {"command", "speak"}});
    CHECK(rig.last_error(*op)["code"] == "missing_field");

    rig.ctx->registry().unregister_connection("dev");
    rig.send("op", {{"type", "call_command"}, {"callId", "c5"}, {"command", "speak"}, {"text", "hello?"}});
    rig.settle();
    auto err = rig.last_error(*op);
    CHECK(err["code"] == "delivery_failure" && err["requestType"] == "call_command");
    CHECK(rig.device->of_type("call_ai_response").size() == 2);
}

static void test_call_queries() {
    std::cout << "\n=== calls_list and call_get read live sessions ===" << std::endl;
    RouterRig rig;
    rig.send("obs", {{"type", "calls_list"}});
    auto lists = rig.observer->of_type("calls_list");
    CHECK(lists.size() == 1 && lists[0]["calls"].is_array() && lists[0]["calls"].empty());

    rig.send("dev", {{"type", "call_register"}, {"callId", "a1"}, {"phoneNumber", "+100"}, {"deviceId", "d"}});
    rig.send("dev", {{"type", "call_register"}, {"callId", "a2"}, {"phoneNumber", "+200"}, {"deviceId", "d"},
                     {"isIncoming", false}});
    rig.send("dev", {{"type", "call_status"}, {"callId", "a2"}, {"status", "answered"}});
    rig.settle();

    rig.send("obs", {{"type", "calls_list"}});
    lists = rig.observer->of_type("calls_list");
    CHECK(lists.size() == 2);
    if (lists.size() == 2) {
        const auto& calls = lists[1]["calls"];
        CHECK(calls.size() == 2);
        bool saw_a2 = false;
        for (const auto& call : calls) {
            if (call["callId"] == "a2") {
                saw_a2 = call["status"] == "answered" && call["isIncoming"] == false;
            }
        }
        CHECK(saw_a2);
    }

    rig.ctx->store().append_transcript("a1", "hello there");
    rig.send("obs", {{"type", "call_get"}, {"callId", "a1"}});
    rig.settle();
    auto infos = rig.observer->of_type("call_info");
    CHECK(infos.size() == 1);
    if (!infos.empty()) {
        CHECK(infos[0]["call"]["phoneNumber"] == "+100");
        CHECK(infos[0]["call"]["transcript"] == "hello there");
    }

    rig.send("obs", {{"type", "call_get"}, {"callId", "zz"}});
    rig.settle();
    CHECK(rig.last_error(*rig.observer)["code"] == "not_found");
}

int main() {
    test_parse_rejections();
    test_parse_accepts();
    test_register_status_audio_flow();
    test_burst_keeps_arrival_order();
    test_observe_and_unobserve();
    test_init_ping_and_touch();
    test_observe_from_departed_connection();
    test_operator_command();
    test_call_queries();
    return finish_tests("message_router_test");
}
