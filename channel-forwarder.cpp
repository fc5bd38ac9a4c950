#include "channel-forwarder.h"
#include "keyed-executor.h"
#include "relay-util.h"

#include <iostream>
#include <sstream>

ChannelForwarder::ChannelForwarder(std::shared_ptr<ChannelNotifier> notifier, KeyedExecutor& executor,
                                   std::chrono::milliseconds timeout)
    : notifier_(std::move(notifier)), executor_(executor), timeout_(timeout) {}

std::string ChannelForwarder::format_message(const CallSession& session, ChannelEvent event) {
    std::ostringstream msg;
    const char* direction = session.is_incoming ? "From" : "To";
    switch (event) {
        case ChannelEvent::CallRegistered:
            msg << "📞 *" << (session.is_incoming ? "Incoming" : "Outgoing") << " Call*\n"
                << direction << ": " << session.phone_number << "\n"
                << "ID: " << session.call_id;
            break;
        case ChannelEvent::CallEnded:
            msg << "📞 *Call Ended*\n"
                << "With: " << session.phone_number << "\n"
                << "Duration: " << format_duration(session.duration_s);
            break;
        case ChannelEvent::CallSummary:
            msg << "📝 *Call Summary*\n"
                << direction << ": " << session.phone_number << "\n"
                << "Duration: " << format_duration(session.duration_s) << "\n\n"
                << session.summary;
            break;
    }
    return msg.str();
}

void ChannelForwarder::forward(const CallSession& session, ChannelEvent event) {
    if (!notifier_) {
        return;
    }
    if (policy_ && !policy_(session, event)) {
        return;
    }

    std::string message = format_message(session, event);
    std::string call_id = session.call_id;
    // Single key keeps channel messages in the order events happened
    bool posted = executor_.post("channel", [this, message, call_id]() {
        if (!notifier_->notify_channel(message, timeout_)) {
            std::cout << "⚠️ Channel notification failed for call " << call_id << std::endl;
        }
    });
    if (!posted) {
        std::cout << "⚠️ Channel notification dropped for call " << call_id << std::endl;
    }
}
