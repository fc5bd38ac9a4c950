#include "keyed-executor.h"

#include <iostream>
#include <exception>

void WorkTracker::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    inflight_++;
}

void WorkTracker::end() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (inflight_ > 0) inflight_--;
    if (inflight_ == 0) cv_.notify_all();
}

void WorkTracker::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return inflight_ == 0; });
}

bool WorkTracker::wait_idle_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return inflight_ == 0; });
}

size_t WorkTracker::inflight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_;
}

KeyedExecutor::KeyedExecutor(const std::string& name, size_t n_threads,
                             std::shared_ptr<WorkTracker> tracker)
    : name_(name), n_threads_(n_threads == 0 ? 1 : n_threads),
      tracker_(std::move(tracker)), running_(false) {}

KeyedExecutor::~KeyedExecutor() {
    stop();
}

bool KeyedExecutor::start() {
    if (running_.load()) return true;
    running_.store(true);
    for (size_t i = 0; i < n_threads_; ++i) {
        workers_.emplace_back(&KeyedExecutor::worker_loop, this);
    }
    return true;
}

void KeyedExecutor::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    }
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = queued_tasks_;
        queues_.clear();
        ready_.clear();
        queued_tasks_ = 0;
    }
    if (tracker_) {
        for (size_t i = 0; i < dropped; ++i) tracker_->end();
    }
    if (dropped > 0) {
        std::cout << "⚠️ [" << name_ << "] dropped " << dropped << " queued task(s) on stop" << std::endl;
    }
}

bool KeyedExecutor::post(const std::string& key, std::function<void()> task) {
    if (!running_.load()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    KeyQueue& q = queues_[key];
    q.tasks.push_back(std::move(task));
    queued_tasks_++;
    if (tracker_) tracker_->begin();

    if (!q.active) {
        q.active = true;
        ready_.push_back(key);
        cv_.notify_one();
    }
    return true;
}

size_t KeyedExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_tasks_;
}

void KeyedExecutor::worker_loop() {
    while (true) {
        std::string key;
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_.load() || !ready_.empty(); });
            if (!running_.load()) {
                return;
            }

            key = ready_.front();
            ready_.pop_front();
            auto it = queues_.find(key);
            if (it == queues_.end() || it->second.tasks.empty()) {
                continue;
            }
            task = std::move(it->second.tasks.front());
            it->second.tasks.pop_front();
            queued_tasks_--;
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cout << "❌ [" << name_ << "] task for key " << key << " failed: " << e.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = queues_.find(key);
            if (it != queues_.end()) {
                if (it->second.tasks.empty()) {
                    queues_.erase(it);
                } else {
                    // One task per turn keeps busy keys from starving others
                    ready_.push_back(key);
                    cv_.notify_one();
                }
            }
        }

        if (tracker_) tracker_->end();
    }
}
