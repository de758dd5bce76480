#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include <cstdint>

struct ssl_ctx_st;
struct ssl_st;

namespace clawlink {

enum class ReadStatus {
    Message,   // one complete text message was read
    Timeout,   // nothing complete arrived before the timeout
    Closed,    // peer closed, or close() was called
    Error,     // I/O or framing failure
};

// Message-framed transport to the Gateway (injectable for testing).
//
// Threading contract: one reader thread calls receive(); send_text() may be
// called from any thread; close() may be called from any thread at any time
// and must make a blocked open()/receive() return promptly.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool open(const std::string& url, long timeout_ms, std::string& error) = 0;
    virtual bool send_text(const std::string& data) = 0;
    virtual ReadStatus receive(std::string& out, long timeout_ms) = 0;
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path;   // includes leading / and query string
};

// Accepts ws://, wss://, http:// and https:// URLs.
bool parse_ws_url(const std::string& url, ParsedUrl& out, std::string& error);

// Same URL with host and port replaced (scheme, path and query kept).
std::string rewrite_url_endpoint(const std::string& url, const std::string& host,
                                 uint16_t port);

// ── RFC 6455 framing ─────────────────────────────────────────

namespace ws {

constexpr uint8_t kOpContinuation = 0x0;
constexpr uint8_t kOpText         = 0x1;
constexpr uint8_t kOpBinary       = 0x2;
constexpr uint8_t kOpClose        = 0x8;
constexpr uint8_t kOpPing         = 0x9;
constexpr uint8_t kOpPong         = 0xA;

constexpr size_t kMaxMessageBytes = 16 * 1024 * 1024;

struct Frame {
    bool fin = true;
    uint8_t opcode = kOpText;
    std::string payload;   // unmasked
};

enum class ParseStatus { Complete, NeedMore, Invalid };

// Parse one frame from the front of `buf`. On Complete the frame's bytes are
// removed from `buf`; otherwise `buf` is untouched.
ParseStatus parse_frame(std::string& buf, Frame& out,
                        size_t max_payload = kMaxMessageBytes);

// Single FIN frame. `mask` is 4 bytes, or nullptr for an unmasked frame.
std::string encode_frame(uint8_t opcode, const std::string& payload,
                         const uint8_t* mask);

// Sec-WebSocket-Accept value expected for a given Sec-WebSocket-Key.
std::string accept_key(const std::string& client_key);

} // namespace ws

// RFC 6455 client over POSIX sockets + OpenSSL.
class WebSocketTransport : public Transport {
public:
    WebSocketTransport() = default;
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    bool open(const std::string& url, long timeout_ms, std::string& error) override;
    bool send_text(const std::string& data) override;
    ReadStatus receive(std::string& out, long timeout_ms) override;
    void close() override;

private:
    enum class Io { Ok, Again, Eof, Fail };

    bool dial(const ParsedUrl& url, long deadline_ms, std::string& error);
    bool tls_handshake(const ParsedUrl& url, long deadline_ms, std::string& error);
    bool upgrade(const ParsedUrl& url, long deadline_ms, std::string& error);

    // Append available bytes to rx_; waits up to deadline.
    Io fill(long deadline_ms);
    bool write_all(const std::string& bytes, long deadline_ms);
    bool send_frame(uint8_t opcode, const std::string& payload);
    bool wait_fd(short events, long deadline_ms);

    std::mutex io_mutex_;        // serializes SSL/socket reads and writes
    std::mutex fd_mutex_;        // guards fd_ against close() during open()
    int fd_ = -1;
    ssl_ctx_st* ctx_ = nullptr;
    ssl_st* ssl_ = nullptr;
    std::atomic<bool> closed_{false};
    std::atomic<bool> upgraded_{false};
    std::atomic<bool> close_sent_{false};
    std::string rx_;             // raw bytes not yet parsed (reader thread)
    std::string partial_;        // fragmented message being assembled
    bool fragmented_ = false;
};

} // namespace clawlink
