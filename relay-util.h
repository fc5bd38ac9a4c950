#pragma once

#include <string>
#include <cstdint>
#include <chrono>

// Base64 helpers on top of OpenSSL EVP. decode accepts embedded whitespace
// (line-wrapped encoders) and rejects anything else that is not base64.
std::string base64_encode(const std::string& bytes);
bool base64_decode(const std::string& text, std::string& bytes);

// Random RFC 4122 version 4 identifier
std::string generate_uuid();

// 2026-01-31T09:15:02.123Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

// Sec-WebSocket-Accept for a client Sec-WebSocket-Key
std::string websocket_accept_key(const std::string& client_key);

// "42 seconds", "1 minute 5 seconds", "3 minutes 0 seconds"
std::string format_duration(int64_t seconds);

std::string trim_copy(const std::string& text);

// Length-prefixed frame I/O shared by the stream protocol clients
bool read_exact_fd(int fd, void* buf, size_t nbytes);
bool write_all_fd(int fd, const void* buf, size_t nbytes);
