#pragma once

#include "call-session.h"
#include "capabilities.h"

#include <string>
#include <memory>
#include <functional>
#include <chrono>

class KeyedExecutor;

enum class ChannelEvent {
    CallRegistered,
    CallEnded,
    CallSummary
};

// Decides whether a call event is worth a chat message
using ForwardingPolicy = std::function<bool(const CallSession& session, ChannelEvent event)>;

// Formats call events for the chat channel and delivers them off the request
// path. Delivery failures are logged and never touch call state.
class ChannelForwarder {
public:
    ChannelForwarder(std::shared_ptr<ChannelNotifier> notifier, KeyedExecutor& executor,
                     std::chrono::milliseconds timeout);

    void set_policy(ForwardingPolicy policy) { policy_ = std::move(policy); }

    void forward(const CallSession& session, ChannelEvent event);

    static std::string format_message(const CallSession& session, ChannelEvent event);

private:
    std::shared_ptr<ChannelNotifier> notifier_;
    KeyedExecutor& executor_;
    std::chrono::milliseconds timeout_;
    ForwardingPolicy policy_;
};
