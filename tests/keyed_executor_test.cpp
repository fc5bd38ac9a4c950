#include "keyed-executor.h"
#include "test-support.h"

#include <vector>
#include <stdexcept>

static void test_same_key_runs_in_post_order() {
    std::cout << "\n=== same key keeps post order ===" << std::endl;
    auto tracker = std::make_shared<WorkTracker>();
    KeyedExecutor exec("order", 4, tracker);
    CHECK(exec.start());

    std::mutex mutex;
    std::vector<int> seen;
    std::atomic<int> running(0);
    std::atomic<int> max_running(0);

    for (int i = 0; i < 200; ++i) {
        CHECK(exec.post("call-1", [&, i]() {
            int now = ++running;
            int prev = max_running.load();
            while (now > prev && !max_running.compare_exchange_weak(prev, now)) {}
            {
                std::lock_guard<std::mutex> lock(mutex);
                seen.push_back(i);
            }
            --running;
        }));
    }

    CHECK(tracker->wait_idle_for(std::chrono::milliseconds(5000)));
    CHECK(seen.size() == 200);
    bool ordered = true;
    for (size_t i = 0; i < seen.size(); ++i) {
        if (seen[i] != static_cast<int>(i)) ordered = false;
    }
    CHECK(ordered);
    CHECK(max_running.load() == 1);
    exec.stop();
}

static void test_different_keys_run_in_parallel() {
    std::cout << "\n=== different keys overlap ===" << std::endl;
    auto tracker = std::make_shared<WorkTracker>();
    KeyedExecutor exec("parallel", 2, tracker);
    exec.start();

    std::mutex mutex;
    std::condition_variable cv;
    bool b_ran = false;
    bool a_saw_b = false;

    // a waits for b; with per-key serialization only, this would time out
    exec.post("call-a", [&]() {
        std::unique_lock<std::mutex> lock(mutex);
        a_saw_b = cv.wait_for(lock, std::chrono::seconds(3), [&] { return b_ran; });
    });
    exec.post("call-b", [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        b_ran = true;
        cv.notify_all();
    });

    CHECK(tracker->wait_idle_for(std::chrono::milliseconds(5000)));
    CHECK(a_saw_b);
    exec.stop();
}

static void test_tracker_waits_for_chained_work() {
    std::cout << "\n=== tracker covers follow-up tasks ===" << std::endl;
    auto tracker = std::make_shared<WorkTracker>();
    KeyedExecutor ingest("ingest", 2, tracker);
    KeyedExecutor capability("capability", 2, tracker);
    ingest.start();
    capability.start();

    std::atomic<int> stage(0);
    ingest.post("c1", [&]() {
        stage = 1;
        capability.post("c1#stt", [&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            stage = 2;
            ingest.post("c1", [&]() { stage = 3; });
        });
    });

    CHECK(tracker->wait_idle_for(std::chrono::milliseconds(5000)));
    CHECK(stage.load() == 3);
    CHECK(tracker->inflight() == 0);

    capability.stop();
    ingest.stop();
}

static void test_throwing_task_does_not_kill_worker() {
    std::cout << "\n=== exceptions stay inside the task ===" << std::endl;
    auto tracker = std::make_shared<WorkTracker>();
    KeyedExecutor exec("throws", 1, tracker);
    exec.start();

    std::atomic<bool> after(false);
    exec.post("k", []() { throw std::runtime_error("boom"); });
    exec.post("k", [&]() { after = true; });

    CHECK(tracker->wait_idle_for(std::chrono::milliseconds(3000)));
    CHECK(after.load());
    exec.stop();
}

static void test_post_after_stop_is_refused() {
    std::cout << "\n=== stop drops queued work ===" << std::endl;
    auto tracker = std::make_shared<WorkTracker>();
    KeyedExecutor exec("stopping", 1, tracker);
    exec.start();

    std::mutex gate;
    gate.lock();
    std::atomic<int> ran(0);
    exec.post("k", [&]() { std::lock_guard<std::mutex> lock(gate); ran++; });
    for (int i = 0; i < 5; ++i) {
        exec.post("k", [&]() { ran++; });
    }
    CHECK(wait_until([&] { return exec.pending() == 5; }));

    std::thread stopper([&]() { exec.stop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    gate.unlock();
    stopper.join();

    CHECK(ran.load() == 1);
    CHECK(exec.pending() == 0);
    CHECK(tracker->inflight() == 0);
    CHECK(!exec.post("k", [&]() { ran++; }));
}

int main() {
    test_same_key_runs_in_post_order();
    test_different_keys_run_in_parallel();
    test_tracker_waits_for_chained_work();
    test_throwing_task_does_not_kill_worker();
    test_post_after_stop_is_refused();
    return finish_tests("keyed_executor_test");
}
