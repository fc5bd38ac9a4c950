#include "stream-service-clients.h"
#include "relay-util.h"

#include <iostream>
#include <sstream>
#include <vector>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>

static const uint32_t kByeMarker = 0xFFFFFFFF;
static const size_t kMaxReplyLength = 1024 * 1024;
static const size_t kMaxAudioPayload = 2000000;   // whisper service frame limit

static bool set_socket_timeouts(int fd, std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
           setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

// Non-blocking connect bounded by the timeout, then back to blocking mode
static int connect_with_timeout(const std::string& host, int port, std::chrono::milliseconds timeout) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res) != 0 || !res) {
        return -1;
    }

    int s = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (s < 0) {
        freeaddrinfo(res);
        return -1;
    }

    int flags = fcntl(s, F_GETFL, 0);
    fcntl(s, F_SETFL, flags | O_NONBLOCK);

    int rc = connect(s, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);
    if (rc < 0 && errno != EINPROGRESS) {
        close(s);
        return -1;
    }

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = s;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
            close(s);
            return -1;
        }
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(s, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
            close(s);
            return -1;
        }
    }

    fcntl(s, F_SETFL, flags);
    if (!set_socket_timeouts(s, timeout)) {
        close(s);
        return -1;
    }
    return s;
}

// StreamServiceClient Implementation
StreamServiceClient::StreamServiceClient(const std::string& name, const std::string& host, int port)
    : name_(name), host_(host), port_(port) {}

StreamServiceClient::~StreamServiceClient() {
    cancel_all();
}

int StreamServiceClient::open_session(const std::string& session_id, std::chrono::milliseconds timeout) {
    if (!configured()) {
        return -1;
    }

    int s = connect_with_timeout(host_, port_, timeout);
    if (s < 0) {
        std::cout << "❌ [" << name_ << "] Cannot connect to " << host_ << ":" << port_ << std::endl;
        return -1;
    }

    {
        std::lock_guard<std::mutex> lock(sockets_mutex_);
        open_sockets_.insert(s);
    }

    if (!send_frame(s, session_id)) {
        std::cout << "❌ [" << name_ << "] HELLO failed for " << session_id << std::endl;
        close_session(s, false);
        return -1;
    }
    return s;
}

void StreamServiceClient::close_session(int socket, bool send_bye) {
    if (send_bye) {
        uint32_t bye = kByeMarker;
        if (!write_all_fd(socket, &bye, 4)) {
            std::cout << "⚠️ [" << name_ << "] BYE not delivered" << std::endl;
        }
    }
    {
        std::lock_guard<std::mutex> lock(sockets_mutex_);
        open_sockets_.erase(socket);
    }
    close(socket);
}

bool StreamServiceClient::send_frame(int socket, const std::string& payload) {
    uint32_t length = htonl(static_cast<uint32_t>(payload.size()));
    if (!write_all_fd(socket, &length, 4)) return false;
    if (!payload.empty() && !write_all_fd(socket, payload.data(), payload.size())) return false;
    return true;
}

bool StreamServiceClient::read_frame(int socket, std::string& payload, size_t max_length) {
    uint32_t length = 0;
    if (!read_exact_fd(socket, &length, 4)) return false;
    length = ntohl(length);
    if (length == kByeMarker) {
        payload.clear();
        return true;
    }
    if (length > max_length) return false;
    payload.resize(length);
    if (length > 0 && !read_exact_fd(socket, &payload[0], length)) return false;
    return true;
}

bool StreamServiceClient::request(const std::string& session_id, const std::string& payload,
                                  std::chrono::milliseconds timeout, std::string& reply) {
    auto t0 = std::chrono::steady_clock::now();
    int s = open_session(session_id, timeout);
    if (s < 0) {
        return false;
    }

    if (!send_frame(s, payload)) {
        std::cout << "❌ [" << name_ << "] Send failed for " << session_id << std::endl;
        close_session(s, false);
        return false;
    }

    if (!read_frame(s, reply, kMaxReplyLength)) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        std::cout << "⚠️ [" << name_ << "] No reply for " << session_id << " after " << ms << "ms" << std::endl;
        close_session(s, false);
        return false;
    }

    close_session(s, true);
    return true;
}

bool StreamServiceClient::post(const std::string& session_id, const std::string& payload,
                               std::chrono::milliseconds timeout) {
    int s = open_session(session_id, timeout);
    if (s < 0) {
        return false;
    }
    bool ok = send_frame(s, payload);
    close_session(s, ok);
    return ok;
}

void StreamServiceClient::cancel_all() {
    std::lock_guard<std::mutex> lock(sockets_mutex_);
    for (int s : open_sockets_) {
        // Unblocks the owning thread, which still closes the descriptor
        shutdown(s, SHUT_RDWR);
    }
}

// WhisperTranscriptionClient Implementation
WhisperTranscriptionClient::WhisperTranscriptionClient(const std::string& host, int port)
    : client_("whisper", host, port) {}

std::string WhisperTranscriptionClient::pcm16_to_float32(const std::string& pcm) {
    size_t n = pcm.size() / 2;
    std::vector<float> samples(n);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(pcm.data());
    for (size_t i = 0; i < n; ++i) {
        int16_t s = static_cast<int16_t>(p[2 * i] | (p[2 * i + 1] << 8));
        samples[i] = static_cast<float>(s) / 32768.0f;
    }
    return std::string(reinterpret_cast<const char*>(samples.data()), n * sizeof(float));
}

bool WhisperTranscriptionClient::transcribe(const std::string& audio_bytes, const CallContext& context,
                                            std::chrono::milliseconds timeout, std::string& text) {
    std::string payload = pcm16_to_float32(audio_bytes);
    if (payload.empty()) {
        text.clear();
        return true;
    }
    if (payload.size() > kMaxAudioPayload) {
        // Keep the most recent window the service accepts
        size_t keep = kMaxAudioPayload - (kMaxAudioPayload % sizeof(float));
        std::cout << "⚠️ [whisper] Trimming " << (payload.size() - keep) << " bytes of older audio for call "
                  << context.call_id << std::endl;
        payload = payload.substr(payload.size() - keep);
    }

    if (!client_.request(context.call_id, payload, timeout, text)) {
        return false;
    }
    text = trim_copy(text);
    return true;
}

// LlamaResponseClient Implementation
LlamaResponseClient::LlamaResponseClient(const std::string& host, int port)
    : client_("llama", host, port) {}

bool LlamaResponseClient::generate_response(const std::string& text, const CallContext& context,
                                            std::chrono::milliseconds timeout, std::string& response) {
    // The service keeps conversation history per session id
    return client_.request(context.call_id, build_response_prompt(text, context), timeout, response);
}

std::string LlamaResponseClient::build_response_prompt(const std::string& text, const CallContext& context) {
    std::ostringstream prompt;
    prompt << "[" << (context.is_incoming ? "Incoming call from " : "Outgoing call to ")
           << context.phone_number << ", " << (context.in_progress ? "in progress" : "ended") << "]\n"
           << "Reply in one or two short spoken sentences. Start with [END_CALL] to hang up.\n\n"
           << "Caller: " << text;
    return prompt.str();
}

std::string LlamaResponseClient::build_summary_prompt(const std::string& transcript, const CallContext& context) {
    std::ostringstream prompt;
    prompt << "Summarize this phone call " << (context.is_incoming ? "from " : "to ")
           << context.phone_number << " (duration " << format_duration(context.duration_s) << ")."
           << " List any requests, commitments and follow-ups.\n\n"
           << "Transcript:\n" << transcript;
    return prompt.str();
}

bool LlamaResponseClient::summarize(const std::string& transcript, const CallContext& context,
                                    std::chrono::milliseconds timeout, std::string& summary) {
    // Separate session so the summary request does not join the live conversation
    return client_.request(context.call_id + "-summary", build_summary_prompt(transcript, context),
                           timeout, summary);
}

// ChatBridgeNotifier Implementation
ChatBridgeNotifier::ChatBridgeNotifier(const std::string& host, int port)
    : client_("chat", host, port) {}

bool ChatBridgeNotifier::notify_channel(const std::string& message, std::chrono::milliseconds timeout) {
    if (!client_.configured()) {
        std::cout << "📣 [channel] " << message << std::endl;
        return true;
    }
    return client_.post("channel", message, timeout);
}
