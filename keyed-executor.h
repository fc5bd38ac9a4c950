#pragma once

#include <string>
#include <vector>
#include <deque>
#include <unordered_map>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>

// Counts work that is queued or running across one or more executors. A task
// that posts follow-up work does so before it finishes, so the count only
// reaches zero once a whole chain has drained.
class WorkTracker {
public:
    void begin();
    void end();
    void wait_idle();
    bool wait_idle_for(std::chrono::milliseconds timeout);
    size_t inflight() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t inflight_ = 0;
};

// Worker pool with per-key ordering. Tasks posted under the same key run one at
// a time in post order; tasks under different keys run in parallel.
class KeyedExecutor {
public:
    KeyedExecutor(const std::string& name, size_t n_threads,
                  std::shared_ptr<WorkTracker> tracker = nullptr);
    ~KeyedExecutor();

    bool start();
    // Finishes running tasks, drops queued ones
    void stop();
    bool is_running() const { return running_.load(); }

    bool post(const std::string& key, std::function<void()> task);

    size_t pending() const;
    const std::string& name() const { return name_; }

private:
    struct KeyQueue {
        std::deque<std::function<void()>> tasks;
        bool active = false;    // queued in ready_ or running on a worker
    };

    std::string name_;
    size_t n_threads_;
    std::shared_ptr<WorkTracker> tracker_;

    std::atomic<bool> running_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, KeyQueue> queues_;
    std::deque<std::string> ready_;
    size_t queued_tasks_ = 0;

    void worker_loop();
};
