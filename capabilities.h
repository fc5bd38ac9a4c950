#pragma once

#include <string>
#include <chrono>
#include <cstdint>

// Call facts handed to the external services with every request
struct CallContext {
    std::string call_id;
    std::string phone_number;
    bool is_incoming = true;
    bool in_progress = true;
    int64_t duration_s = 0;
};

// External capabilities. Every call must return within the given timeout;
// false means failure or timeout and leaves core state untouched.
class TranscriptionCapability {
public:
    virtual ~TranscriptionCapability() = default;
    virtual bool transcribe(const std::string& audio_bytes, const CallContext& context,
                            std::chrono::milliseconds timeout, std::string& text) = 0;
    // Aborts in-flight requests on shutdown
    virtual void cancel_all() {}
};

class ResponseCapability {
public:
    virtual ~ResponseCapability() = default;
    virtual bool generate_response(const std::string& text, const CallContext& context,
                                   std::chrono::milliseconds timeout, std::string& response) = 0;
    virtual void cancel_all() {}
};

class SummaryCapability {
public:
    virtual ~SummaryCapability() = default;
    virtual bool summarize(const std::string& transcript, const CallContext& context,
                           std::chrono::milliseconds timeout, std::string& summary) = 0;
    virtual void cancel_all() {}
};

class ChannelNotifier {
public:
    virtual ~ChannelNotifier() = default;
    virtual bool notify_channel(const std::string& message, std::chrono::milliseconds timeout) = 0;
    virtual void cancel_all() {}
};
