#pragma once

#include "call-session.h"
#include "capabilities.h"
#include "connection-registry.h"
#include "call-session-store.h"
#include "observer-fanout.h"
#include "keyed-executor.h"
#include "transcription-batch-policy.h"
#include "audio-ingest-pipeline.h"
#include "response-pipeline.h"
#include "channel-forwarder.h"
#include "message-router.h"

#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>

class CallHistory;

struct CoordinatorConfig {
    size_t batch_threshold = 20;                            // fragments per transcription attempt, 0 = end of call only
    std::chrono::milliseconds capability_timeout{15000};
    std::chrono::seconds audio_retention{60};
    std::chrono::seconds session_retention{600};
    std::chrono::seconds evict_after{1800};
    std::chrono::seconds evict_interval{60};
    std::chrono::milliseconds cleanup_interval{1000};
    size_t ingest_workers = 4;
    size_t capability_workers = 4;
    std::string ws_path = "/ws";
    size_t max_frame_bytes = 16 * 1024 * 1024;
    bool verbose = false;
};

// External services; any of them may be null, which disables that step
struct CoordinatorCapabilities {
    std::shared_ptr<TranscriptionCapability> transcriber;
    std::shared_ptr<ResponseCapability> responder;
    std::shared_ptr<SummaryCapability> summarizer;
    std::shared_ptr<ChannelNotifier> notifier;
};

// Process-wide object graph. Built once at startup and handed to the
// transport; tests build as many isolated instances as they like.
class CoordinatorContext {
public:
    CoordinatorContext(const CoordinatorConfig& config, const CoordinatorCapabilities& capabilities,
                       ClockFn clock = nullptr);
    ~CoordinatorContext();

    bool start(bool background_maintenance = true);
    void stop();
    bool is_running() const { return running_.load(); }

    // Optional durable sink; attach before start()
    void attach_history(std::shared_ptr<CallHistory> history) { history_ = std::move(history); }

    // Blocks until every queued and chained task has run
    void wait_idle() { tracker_->wait_idle(); }
    bool wait_idle_for(std::chrono::milliseconds timeout) { return tracker_->wait_idle_for(timeout); }

    // One maintenance pass: expire call data, optionally evict idle connections
    CleanupResult run_maintenance_once(bool evict = true);

    ConnectionRegistry& registry() { return registry_; }
    CallSessionStore& store() { return store_; }
    ObserverFanout& fanout() { return fanout_; }
    TranscriptionBatchPolicy& batch_policy() { return policy_; }
    AudioIngestPipeline& audio() { return audio_; }
    ResponsePipeline& responses() { return responses_; }
    ChannelForwarder& channel() { return channel_; }
    MessageRouter& router() { return router_; }
    const CoordinatorConfig& config() const { return config_; }

private:
    CoordinatorConfig config_;
    CoordinatorCapabilities capabilities_;
    std::shared_ptr<WorkTracker> tracker_;
    std::shared_ptr<CallHistory> history_;

    ConnectionRegistry registry_;
    CallSessionStore store_;
    ObserverFanout fanout_;
    TranscriptionBatchPolicy policy_;
    KeyedExecutor ingest_;
    KeyedExecutor capability_;
    ChannelForwarder channel_;
    AudioIngestPipeline audio_;
    ResponsePipeline responses_;
    MessageRouter router_;

    std::atomic<bool> running_;
    std::thread maintenance_thread_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;

    void wire();
    void maintenance_loop();
};
