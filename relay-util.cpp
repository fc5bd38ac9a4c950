#include "relay-util.h"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <sys/socket.h>
#include <ctime>
#include <cctype>
#include <random>
#include <sstream>
#include <iomanip>
#include <vector>

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) return "";
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
                            static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<char*>(out.data()), n > 0 ? n : 0);
}

bool base64_decode(const std::string& text, std::string& bytes) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (c == '\r' || c == '\n' || c == ' ' || c == '\t') continue;
        clean.push_back(c);
    }

    bytes.clear();
    if (clean.empty()) return true;
    if (clean.size() % 4 != 0) return false;

    std::vector<unsigned char> out(3 * (clean.size() / 4) + 1);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0) return false;

    // EVP_DecodeBlock counts padding characters as zero bytes
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;
    if (static_cast<size_t>(n) < padding) return false;

    bytes.assign(reinterpret_cast<char*>(out.data()), static_cast<size_t>(n) - padding);
    return true;
}

std::string generate_uuid() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        // OpenSSL RNG unavailable, fall back to the platform generator
        std::random_device rd;
        for (auto& v : b) v = static_cast<unsigned char>(rd() & 0xFF);
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(b[i]);
    }
    return ss.str();
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) { millis += 1000; secs -= 1; }

    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return ss.str();
}

std::string websocket_accept_key(const std::string& client_key) {
    static const char* kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string input = client_key + kGuid;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, input.data(), input.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }
    EVP_MD_CTX_free(ctx);

    return base64_encode(std::string(reinterpret_cast<char*>(digest), digest_len));
}

std::string format_duration(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    int64_t mins = seconds / 60;
    int64_t secs = seconds % 60;

    std::ostringstream ss;
    if (mins == 0) {
        ss << secs << " seconds";
    } else if (mins == 1) {
        ss << "1 minute " << secs << " seconds";
    } else {
        ss << mins << " minutes " << secs << " seconds";
    }
    return ss.str();
}

std::string trim_copy(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

bool read_exact_fd(int fd, void* buf, size_t nbytes) {
    uint8_t* p = static_cast<uint8_t*>(buf);
    size_t off = 0;
    while (off < nbytes) {
        ssize_t m = recv(fd, p + off, nbytes - off, 0);
        if (m <= 0) return false;
        off += static_cast<size_t>(m);
    }
    return true;
}

bool write_all_fd(int fd, const void* buf, size_t nbytes) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    size_t off = 0;
    while (off < nbytes) {
        ssize_t m = send(fd, p + off, nbytes - off, MSG_NOSIGNAL);
        if (m <= 0) return false;
        off += static_cast<size_t>(m);
    }
    return true;
}
