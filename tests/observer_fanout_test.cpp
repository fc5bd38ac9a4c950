#include "observer-fanout.h"
#include "connection-registry.h"
#include "relay-util.h"
#include "test-support.h"

#include <memory>

static void test_transcript_reaches_every_observer() {
    std::cout << "\n=== two observers get the same transcript delta ===" << std::endl;
    ManualClock clock;
    ConnectionRegistry registry(clock.fn());
    ObserverFanout fanout(registry, clock.fn());

    auto o1 = std::make_shared<FakeTransport>();
    auto o2 = std::make_shared<FakeTransport>();
    registry.register_connection("o1", o1);
    registry.register_connection("o2", o2);

    CHECK(fanout.subscribe("c1", "o1"));
    CHECK(fanout.subscribe("c1", "o2"));
    CHECK(!fanout.subscribe("c1", "o2"));
    // Observer that is not a registered connection: skipped quietly
    CHECK(fanout.subscribe("c1", "o3-gone"));

    size_t delivered = fanout.publish_transcript("c1", "hello world", false);
    CHECK(delivered == 2);

    auto m1 = o1->of_type("call_transcript");
    auto m2 = o2->of_type("call_transcript");
    CHECK(m1.size() == 1 && m2.size() == 1);
    if (m1.size() == 1 && m2.size() == 1) {
        CHECK(m1[0]["callId"] == "c1");
        CHECK(m1[0]["callId"] == m2[0]["callId"]);
        CHECK(m1[0]["transcript"] == "hello world");
        CHECK(m1[0]["transcript"] == m2[0]["transcript"]);
        CHECK(m1[0]["isFinal"] == false);
        CHECK(m1[0]["timestamp"] == format_iso8601(clock.now()));
    }
}

static void test_failed_delivery_is_skipped() {
    std::cout << "\n=== a failing observer does not block the rest ===" << std::endl;
    ConnectionRegistry registry;
    ObserverFanout fanout(registry);
    auto bad = std::make_shared<FakeTransport>();
    auto good = std::make_shared<FakeTransport>();
    bad->set_fail(true);
    registry.register_connection("bad", bad);
    registry.register_connection("good", good);
    fanout.subscribe("c1", "bad");
    fanout.subscribe("c1", "good");

    CHECK(fanout.publish_summary("c1", "short call") == 1);
    auto got = good->of_type("call_summary");
    CHECK(got.size() == 1 && got[0]["summary"] == "short call");

    CHECK(fanout.publish_ai_response("c1", "speak", "hi") == 1);
    auto resp = good->of_type("call_ai_response");
    CHECK(resp.size() == 1 && resp[0]["responseType"] == "speak" && resp[0]["text"] == "hi");

    CHECK(fanout.publish_summary("nobody-watching", "x") == 0);
}

static void test_session_update_omits_transcript() {
    std::cout << "\n=== call_update carries session fields only ===" << std::endl;
    ConnectionRegistry registry;
    ObserverFanout fanout(registry);
    auto o = std::make_shared<FakeTransport>();
    registry.register_connection("o", o);
    fanout.subscribe("c9", "o");

    CallSession s;
    s.call_id = "c9";
    s.phone_number = "+15551112222";
    s.device_id = "dev";
    s.status = CallStatus::Answered;
    s.has_answered = true;
    s.transcript = "secret words";
    CHECK(fanout.publish_session(s) == 1);

    auto updates = o->of_type("call_update");
    CHECK(updates.size() == 1);
    if (!updates.empty()) {
        CHECK(updates[0]["callId"] == "c9");
        CHECK(updates[0]["call"]["status"] == "answered");
        CHECK(!updates[0]["call"].contains("transcript"));
    }
}

static void test_prune_on_disconnect() {
    std::cout << "\n=== unregistering prunes only that connection ===" << std::endl;
    ConnectionRegistry registry;
    ObserverFanout fanout(registry);
    registry.set_disconnect_handler([&](const std::string& id) { fanout.prune_connection(id); });

    registry.register_connection("x", std::make_shared<FakeTransport>());
    registry.register_connection("y", std::make_shared<FakeTransport>());
    fanout.subscribe("c1", "x");
    fanout.subscribe("c2", "x");
    fanout.subscribe("c2", "y");
    fanout.subscribe("c3", "y");

    registry.unregister_connection("x");

    CHECK(fanout.subscribers("c1").empty());
    auto c2 = fanout.subscribers("c2");
    CHECK(c2.size() == 1 && c2[0] == "y");
    CHECK(fanout.subscribers("c3").size() == 1);

    CHECK(fanout.unsubscribe("c3", "y"));
    CHECK(!fanout.unsubscribe("c3", "y"));
    CHECK(fanout.subscribers("c3").empty());

    fanout.drop_call("c2");
    CHECK(fanout.subscribers("c2").empty());
}

int main() {
    test_transcript_reaches_every_observer();
    test_failed_delivery_is_skipped();
    test_session_update_omits_transcript();
    test_prune_on_disconnect();
    return finish_tests("observer_fanout_test");
}
