#include "coordinator-context.h"
#include "call-history.h"

#include <iostream>

static CallStoreConfig make_store_config(const CoordinatorConfig& config) {
    CallStoreConfig store_config;
    store_config.audio_retention = config.audio_retention;
    store_config.session_retention = config.session_retention;
    return store_config;
}

CoordinatorContext::CoordinatorContext(const CoordinatorConfig& config, const CoordinatorCapabilities& capabilities,
                                       ClockFn clock)
    : config_(config),
      capabilities_(capabilities),
      tracker_(std::make_shared<WorkTracker>()),
      registry_(clock),
      store_(make_store_config(config), clock),
      fanout_(registry_, clock),
      policy_(config.batch_threshold),
      ingest_("ingest", config.ingest_workers, tracker_),
      capability_("capability", config.capability_workers, tracker_),
      channel_(capabilities.notifier, capability_, config.capability_timeout),
      audio_(store_, policy_, ingest_, capability_, capabilities.transcriber, config.capability_timeout),
      responses_(store_, registry_, fanout_, capability_, channel_,
                 capabilities.responder, capabilities.summarizer, config.capability_timeout),
      router_(registry_, store_, fanout_, audio_, ingest_, clock),
      running_(false) {
    registry_.set_verbose(config.verbose);
    audio_.set_verbose(config.verbose);
    router_.set_verbose(config.verbose);
    wire();
}

CoordinatorContext::~CoordinatorContext() {
    stop();
}

void CoordinatorContext::wire() {
    store_.set_registered_listener([this](const CallSession& session) {
        channel_.forward(session, ChannelEvent::CallRegistered);
        if (history_) {
            history_->record_call_started(session);
        }
    });

    store_.set_status_listener([this](const CallSession& session) {
        fanout_.publish_session(session);
    });

    // Fires once per call: flush remaining audio, then summarize behind it
    store_.set_ended_listener([this](const CallSession& session) {
        std::cout << "📞 Call " << session.call_id << " ended after "
                  << session.duration_s << "s" << std::endl;
        channel_.forward(session, ChannelEvent::CallEnded);
        std::string call_id = session.call_id;
        audio_.flush(call_id, [this, call_id]() {
            responses_.finalize(call_id);
        });
    });

    audio_.set_delta_handler([this](const CallSession& session, const std::string& delta, bool is_final) {
        fanout_.publish_transcript(session.call_id, delta, is_final);
        if (!is_final) {
            responses_.on_transcript_delta(session.call_id, delta);
        }
    });

    responses_.set_finalized_handler([this](const CallSession& session) {
        if (history_) {
            history_->record_call_finalized(session);
        }
    });

    registry_.set_disconnect_handler([this](const std::string& connection_id) {
        size_t pruned = fanout_.prune_connection(connection_id);
        if (pruned > 0) {
            std::cout << "🧹 Removed " << connection_id << " from " << pruned << " observer sets" << std::endl;
        }
    });
}

bool CoordinatorContext::start(bool background_maintenance) {
    if (running_.exchange(true)) {
        return true;
    }

    if (!ingest_.start() || !capability_.start()) {
        std::cerr << "❌ Failed to start worker pools" << std::endl;
        ingest_.stop();
        capability_.stop();
        running_ = false;
        return false;
    }

    if (background_maintenance) {
        maintenance_thread_ = std::thread(&CoordinatorContext::maintenance_loop, this);
    }

    std::cout << "✅ Coordinator started (batch " << config_.batch_threshold
              << ", timeout " << config_.capability_timeout.count() << "ms, "
              << config_.ingest_workers << "+" << config_.capability_workers << " workers)" << std::endl;
    return true;
}

void CoordinatorContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        maintenance_cv_.notify_all();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    // Let short chains finish, then abort whatever is still talking to a service
    if (!tracker_->wait_idle_for(std::chrono::milliseconds(2000))) {
        std::cout << "⚠️ " << tracker_->inflight() << " tasks still pending, cancelling service calls" << std::endl;
    }
    if (capabilities_.transcriber) capabilities_.transcriber->cancel_all();
    if (capabilities_.responder) capabilities_.responder->cancel_all();
    if (capabilities_.summarizer) capabilities_.summarizer->cancel_all();
    if (capabilities_.notifier) capabilities_.notifier->cancel_all();

    ingest_.stop();
    capability_.stop();
    std::cout << "🛑 Coordinator stopped" << std::endl;
}

CleanupResult CoordinatorContext::run_maintenance_once(bool evict) {
    CleanupResult result = store_.cleanup_expired();
    for (const auto& call_id : result.sessions_dropped) {
        fanout_.drop_call(call_id);
    }
    if (result.audio_discarded > 0 || !result.sessions_dropped.empty()) {
        std::cout << "🧹 Cleanup: " << result.audio_discarded << " audio buffers discarded, "
                  << result.sessions_dropped.size() << " sessions dropped" << std::endl;
    }

    if (evict) {
        size_t evicted = registry_.evict_inactive(config_.evict_after);
        if (evicted > 0) {
            std::cout << "🧹 Evicted " << evicted << " inactive connections" << std::endl;
        }
    }
    return result;
}

void CoordinatorContext::maintenance_loop() {
    auto next_evict = std::chrono::steady_clock::now() + config_.evict_interval;

    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (running_) {
        maintenance_cv_.wait_for(lock, config_.cleanup_interval, [this] { return !running_.load(); });
        if (!running_) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        bool evict = now >= next_evict;
        if (evict) {
            next_evict = now + config_.evict_interval;
        }

        lock.unlock();
        run_maintenance_once(evict);
        lock.lock();
    }
}
