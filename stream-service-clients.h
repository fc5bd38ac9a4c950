#pragma once

#include "capabilities.h"

#include <string>
#include <set>
#include <mutex>
#include <chrono>

// Client side of the length-prefixed stream protocol spoken by the
// transcription and LLM services:
//   HELLO   = u32 big-endian length + session id
//   payload = u32 length + bytes (repeated)
//   reply   = u32 length + UTF-8 text
//   BYE     = u32 0xFFFFFFFF
// Each request opens its own socket; send/receive timeouts bound every call.
class StreamServiceClient {
public:
    StreamServiceClient(const std::string& name, const std::string& host, int port);
    ~StreamServiceClient();

    bool configured() const { return !host_.empty() && port_ > 0; }
    const std::string& name() const { return name_; }

    // One HELLO, one payload frame, one reply frame, BYE
    bool request(const std::string& session_id, const std::string& payload,
                 std::chrono::milliseconds timeout, std::string& reply);
    // One HELLO, one payload frame, BYE; no reply expected
    bool post(const std::string& session_id, const std::string& payload,
              std::chrono::milliseconds timeout);

    void cancel_all();

private:
    std::string name_;
    std::string host_;
    int port_;

    std::set<int> open_sockets_;
    std::mutex sockets_mutex_;

    int open_session(const std::string& session_id, std::chrono::milliseconds timeout);
    void close_session(int socket, bool send_bye);
    bool send_frame(int socket, const std::string& payload);
    bool read_frame(int socket, std::string& payload, size_t max_length);
};

// Sends 16-bit little-endian PCM as float32 samples to the whisper service
class WhisperTranscriptionClient : public TranscriptionCapability {
public:
    WhisperTranscriptionClient(const std::string& host, int port);

    bool transcribe(const std::string& audio_bytes, const CallContext& context,
                    std::chrono::milliseconds timeout, std::string& text) override;
    void cancel_all() override { client_.cancel_all(); }

    static std::string pcm16_to_float32(const std::string& pcm);

private:
    StreamServiceClient client_;
};

// Conversational responses and end-of-call summaries from the llama service
class LlamaResponseClient : public ResponseCapability, public SummaryCapability {
public:
    LlamaResponseClient(const std::string& host, int port);

    bool generate_response(const std::string& text, const CallContext& context,
                           std::chrono::milliseconds timeout, std::string& response) override;
    bool summarize(const std::string& transcript, const CallContext& context,
                   std::chrono::milliseconds timeout, std::string& summary) override;
    void cancel_all() override { client_.cancel_all(); }

    static std::string build_response_prompt(const std::string& text, const CallContext& context);
    static std::string build_summary_prompt(const std::string& transcript, const CallContext& context);

private:
    StreamServiceClient client_;
};

// Posts channel messages to a chat bridge, or only logs them when no bridge
// endpoint is configured
class ChatBridgeNotifier : public ChannelNotifier {
public:
    ChatBridgeNotifier(const std::string& host, int port);

    bool notify_channel(const std::string& message, std::chrono::milliseconds timeout) override;
    void cancel_all() override { client_.cancel_all(); }

private:
    StreamServiceClient client_;
};
