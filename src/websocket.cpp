// WebSocket client using POSIX sockets + OpenSSL.
// The socket stays non-blocking after connect; every wait is a poll() in
// short slices so close() from another thread is noticed promptly.
#include "transport.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <sys/socket.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <vector>

namespace clawlink {

namespace {

constexpr long kPollSliceMs = 100;
constexpr long kSendTimeoutMs = 10000;
constexpr size_t kMaxHandshakeBytes = 16 * 1024;
const char* const kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

long now_ms() {
    using namespace std::chrono;
    return static_cast<long>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return s;
}

bool is_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // namespace

// ── URL parsing ────────────────────────────────────────────────

bool parse_ws_url(const std::string& url, ParsedUrl& out, std::string& error) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        error = "invalid URL: " + url;
        return false;
    }

    std::string scheme = lower(url.substr(0, scheme_end));
    if (scheme == "wss" || scheme == "https") {
        out.tls = true;
    } else if (scheme == "ws" || scheme == "http") {
        out.tls = false;
    } else {
        error = "unsupported URL scheme: " + scheme;
        return false;
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) {
        out.path = "/";
    } else if (url[path_start] == '?') {
        out.path = "/" + url.substr(path_start);
    } else {
        out.path = url.substr(path_start);
    }

    std::string port;
    if (!host_port.empty() && host_port[0] == '[') {
        size_t close = host_port.find(']');
        if (close == std::string::npos) {
            error = "invalid IPv6 host in URL: " + url;
            return false;
        }
        out.host = host_port.substr(1, close - 1);
        if (close + 1 < host_port.size()) {
            if (host_port[close + 1] != ':') {
                error = "invalid URL: " + url;
                return false;
            }
            port = host_port.substr(close + 2);
        }
    } else {
        size_t colon = host_port.rfind(':');
        if (colon != std::string::npos) {
            out.host = host_port.substr(0, colon);
            port = host_port.substr(colon + 1);
        } else {
            out.host = host_port;
        }
    }

    if (out.host.empty()) {
        error = "URL has no host: " + url;
        return false;
    }
    if (port.empty()) {
        out.port = out.tls ? "443" : "80";
    } else if (!is_digits(port) || port.size() > 5 || std::stoul(port) > 65535) {
        error = "invalid port in URL: " + url;
        return false;
    } else {
        out.port = port;
    }
    return true;
}

std::string rewrite_url_endpoint(const std::string& url, const std::string& host,
                                 uint16_t port) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return url;
    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string rest = (path_start == std::string::npos) ? "" : url.substr(path_start);
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return url.substr(0, host_start) + h + ":" + std::to_string(port) + rest;
}

// ── Framing ────────────────────────────────────────────────────

namespace ws {

ParseStatus parse_frame(std::string& buf, Frame& out, size_t max_payload) {
    if (buf.size() < 2) return ParseStatus::NeedMore;
    auto byte = [&buf](size_t i) { return static_cast<uint8_t>(buf[i]); };

    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);
    if (b0 & 0x70) return ParseStatus::Invalid; // no extensions negotiated

    bool fin = (b0 & 0x80) != 0;
    uint8_t opcode = b0 & 0x0F;
    bool masked = (b1 & 0x80) != 0;
    uint64_t len = b1 & 0x7F;
    size_t off = 2;

    if (len == 126) {
        if (buf.size() < 4) return ParseStatus::NeedMore;
        len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
        off = 4;
    } else if (len == 127) {
        if (buf.size() < 10) return ParseStatus::NeedMore;
        len = 0;
        for (size_t i = 2; i < 10; ++i) len = (len << 8) | byte(i);
        if (len >> 63) return ParseStatus::Invalid;
        off = 10;
    }

    switch (opcode) {
        case kOpContinuation: case kOpText: case kOpBinary:
            break;
        case kOpClose: case kOpPing: case kOpPong:
            if (!fin || len > 125) return ParseStatus::Invalid;
            break;
        default:
            return ParseStatus::Invalid;
    }
    if (len > max_payload) return ParseStatus::Invalid;

    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buf.size() < off + 4) return ParseStatus::NeedMore;
        for (size_t i = 0; i < 4; ++i) mask[i] = byte(off + i);
        off += 4;
    }
    if (buf.size() < off + len) return ParseStatus::NeedMore;

    out.fin = fin;
    out.opcode = opcode;
    out.payload = buf.substr(off, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < out.payload.size(); ++i)
            out.payload[i] = static_cast<char>(out.payload[i] ^ mask[i % 4]);
    }
    buf.erase(0, off + static_cast<size_t>(len));
    return ParseStatus::Complete;
}

std::string encode_frame(uint8_t opcode, const std::string& payload,
                         const uint8_t* mask) {
    std::string f;
    f.reserve(payload.size() + 14);
    f.push_back(static_cast<char>(0x80 | opcode));

    uint8_t mask_bit = mask ? 0x80 : 0x00;
    size_t n = payload.size();
    if (n < 126) {
        f.push_back(static_cast<char>(mask_bit | n));
    } else if (n <= 0xFFFF) {
        f.push_back(static_cast<char>(mask_bit | 126));
        f.push_back(static_cast<char>((n >> 8) & 0xFF));
        f.push_back(static_cast<char>(n & 0xFF));
    } else {
        f.push_back(static_cast<char>(mask_bit | 127));
        for (int i = 7; i >= 0; --i)
            f.push_back(static_cast<char>((static_cast<uint64_t>(n) >> (8 * i)) & 0xFF));
    }

    if (mask) {
        f.append(reinterpret_cast<const char*>(mask), 4);
        for (size_t i = 0; i < n; ++i)
            f.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
    } else {
        f += payload;
    }
    return f;
}

std::string accept_key(const std::string& client_key) {
    std::string input = client_key + kWebSocketGuid;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
    return base64_encode(digest, sizeof(digest));
}

} // namespace ws

// ── WebSocketTransport ─────────────────────────────────────────

WebSocketTransport::~WebSocketTransport() {
    if (ssl_) {
        if (!closed_) SSL_shutdown(ssl_);
        SSL_free(ssl_);
    }
    if (ctx_) SSL_CTX_free(ctx_);
    if (fd_ >= 0) ::close(fd_);
}

bool WebSocketTransport::open(const std::string& url, long timeout_ms,
                              std::string& error) {
    ParsedUrl parsed;
    if (!parse_ws_url(url, parsed, error)) return false;

    long deadline = now_ms() + timeout_ms;
    if (!dial(parsed, deadline, error)) return false;
    if (parsed.tls && !tls_handshake(parsed, deadline, error)) return false;
    return upgrade(parsed, deadline, error);
}

bool WebSocketTransport::wait_fd(short events, long deadline_ms) {
    while (!closed_) {
        long remaining = deadline_ms - now_ms();
        if (remaining <= 0) return false;
        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, kPollSliceMs)));
        if (rc > 0) return true;
        if (rc < 0 && errno != EINTR) return false;
    }
    return false;
}

bool WebSocketTransport::dial(const ParsedUrl& url, long deadline_ms,
                              std::string& error) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
    if (gai != 0) {
        error = "cannot resolve " + url.host + ": " + gai_strerror(gai);
        return false;
    }

    bool connected = false;
    error = "cannot connect to " + url.host + ":" + url.port;
    for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        {
            std::lock_guard<std::mutex> lock(fd_mutex_);
            if (closed_) {
                ::close(fd);
                break;
            }
            fd_ = fd;
        }

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            connected = true;
        } else if (errno == EINPROGRESS && wait_fd(POLLOUT, deadline_ms)) {
            int err = 0;
            socklen_t elen = sizeof(err);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
            if (err == 0) {
                connected = true;
            } else {
                error = "cannot connect to " + url.host + ":" + url.port + ": " +
                        std::strerror(err);
            }
        } else if (now_ms() >= deadline_ms) {
            error = "connect to " + url.host + ":" + url.port + " timed out";
        }

        if (!connected) {
            std::lock_guard<std::mutex> lock(fd_mutex_);
            ::close(fd);
            fd_ = -1;
        }
    }
    freeaddrinfo(res);

    if (!connected && closed_) error = "connection closed";
    return connected;
}

bool WebSocketTransport::tls_handshake(const ParsedUrl& url, long deadline_ms,
                                       std::string& error) {
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        error = "TLS init failed: " + ssl_error_string();
        return false;
    }
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ctx_);
    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

    ssl_ = SSL_new(ctx_);
    if (!ssl_) {
        error = "TLS init failed: " + ssl_error_string();
        return false;
    }
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI
    SSL_set1_host(ssl_, url.host.c_str());
    SSL_set_mode(ssl_, SSL_MODE_ENABLE_PARTIAL_WRITE |
                       SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    while (true) {
        int rc = SSL_connect(ssl_);
        if (rc == 1) return true;
        int err = SSL_get_error(ssl_, rc);
        short want;
        if (err == SSL_ERROR_WANT_READ) {
            want = POLLIN;
        } else if (err == SSL_ERROR_WANT_WRITE) {
            want = POLLOUT;
        } else {
            error = "TLS handshake with " + url.host + " failed: " + ssl_error_string();
            return false;
        }
        if (!wait_fd(want, deadline_ms)) {
            error = closed_ ? "connection closed" : "TLS handshake timed out";
            return false;
        }
    }
}

bool WebSocketTransport::upgrade(const ParsedUrl& url, long deadline_ms,
                                 std::string& error) {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        error = "cannot generate WebSocket key";
        return false;
    }
    std::string key = base64_encode(nonce, sizeof(nonce));

    bool default_port = (url.tls && url.port == "443") || (!url.tls && url.port == "80");
    std::string host = url.host.find(':') != std::string::npos
        ? "[" + url.host + "]" : url.host;
    if (!default_port) host += ":" + url.port;

    std::string req;
    req += "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + host + "\r\n";
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: " + key + "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n\r\n";

    if (!write_all(req, deadline_ms)) {
        error = closed_ ? "connection closed" : "failed to send WebSocket upgrade";
        return false;
    }

    size_t header_end;
    while ((header_end = rx_.find("\r\n\r\n")) == std::string::npos) {
        if (rx_.size() > kMaxHandshakeBytes) {
            error = "WebSocket upgrade response too large";
            return false;
        }
        Io io = fill(deadline_ms);
        if (io == Io::Again) {
            error = "WebSocket upgrade timed out";
            return false;
        }
        if (io != Io::Ok) {
            error = closed_ ? "connection closed" : "connection lost during WebSocket upgrade";
            return false;
        }
    }

    std::string head = rx_.substr(0, header_end);
    rx_.erase(0, header_end + 4); // any bytes past the headers are frame data

    std::vector<std::string> lines = split(head, '\n');
    if (lines.empty()) {
        error = "empty WebSocket upgrade response";
        return false;
    }
    std::string status_line = trim(lines[0]);
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos || status_line.compare(sp + 1, 3, "101") != 0) {
        error = "WebSocket upgrade rejected: " + status_line;
        return false;
    }

    std::string upgrade_header;
    std::string accept;
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (name == "upgrade") upgrade_header = lower(value);
        else if (name == "sec-websocket-accept") accept = value;
    }

    if (upgrade_header != "websocket") {
        error = "server did not upgrade to websocket";
        return false;
    }
    if (accept != ws::accept_key(key)) {
        error = "invalid Sec-WebSocket-Accept from server";
        return false;
    }

    upgraded_ = true;
    return true;
}

WebSocketTransport::Io WebSocketTransport::fill(long deadline_ms) {
    char buf[8192];
    while (true) {
        if (closed_) return Io::Eof;

        short want = POLLIN;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(sizeof(buf)));
                if (n > 0) {
                    rx_.append(buf, static_cast<size_t>(n));
                    return Io::Ok;
                }
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_WANT_READ) {
                    want = POLLIN;
                } else if (err == SSL_ERROR_WANT_WRITE) {
                    want = POLLOUT;
                } else if (err == SSL_ERROR_ZERO_RETURN) {
                    return Io::Eof;
                } else {
                    return closed_ ? Io::Eof : Io::Fail;
                }
            } else {
                ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
                if (n > 0) {
                    rx_.append(buf, static_cast<size_t>(n));
                    return Io::Ok;
                }
                if (n == 0) return Io::Eof;
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    return closed_ ? Io::Eof : Io::Fail;
            }
        }

        if (!wait_fd(want, deadline_ms)) return closed_ ? Io::Eof : Io::Again;
    }
}

bool WebSocketTransport::write_all(const std::string& bytes, long deadline_ms) {
    size_t off = 0;
    while (off < bytes.size()) {
        if (closed_) return false;

        short want = POLLOUT;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            const char* p = bytes.data() + off;
            size_t len = bytes.size() - off;
            if (ssl_) {
                int n = SSL_write(ssl_, p, static_cast<int>(len));
                if (n > 0) {
                    off += static_cast<size_t>(n);
                    continue;
                }
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_WANT_WRITE) want = POLLOUT;
                else if (err == SSL_ERROR_WANT_READ) want = POLLIN;
                else return false;
            } else {
                ssize_t n = ::send(fd_, p, len, MSG_NOSIGNAL);
                if (n >= 0) {
                    off += static_cast<size_t>(n);
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    return false;
            }
        }

        if (!wait_fd(want, deadline_ms)) return false;
    }
    return true;
}

bool WebSocketTransport::send_frame(uint8_t opcode, const std::string& payload) {
    uint8_t mask[4];
    if (RAND_bytes(mask, sizeof(mask)) != 1) return false;
    return write_all(ws::encode_frame(opcode, payload, mask), now_ms() + kSendTimeoutMs);
}

bool WebSocketTransport::send_text(const std::string& data) {
    if (!upgraded_ || closed_) return false;
    return send_frame(ws::kOpText, data);
}

ReadStatus WebSocketTransport::receive(std::string& out, long timeout_ms) {
    if (!upgraded_) return ReadStatus::Error;
    long deadline = now_ms() + timeout_ms;

    while (true) {
        ws::Frame frame;
        ws::ParseStatus st = ws::parse_frame(rx_, frame);
        if (st == ws::ParseStatus::Invalid) {
            std::cerr << "[gateway] Invalid WebSocket frame from server\n";
            return ReadStatus::Error;
        }
        if (st == ws::ParseStatus::NeedMore) {
            switch (fill(deadline)) {
                case Io::Ok:    continue;
                case Io::Again: return ReadStatus::Timeout;
                case Io::Eof:   return ReadStatus::Closed;
                case Io::Fail:  return ReadStatus::Error;
            }
        }

        switch (frame.opcode) {
            case ws::kOpText:
            case ws::kOpBinary:
                if (fragmented_) return ReadStatus::Error;
                if (frame.fin) {
                    out = std::move(frame.payload);
                    return ReadStatus::Message;
                }
                partial_ = std::move(frame.payload);
                fragmented_ = true;
                break;

            case ws::kOpContinuation:
                if (!fragmented_) return ReadStatus::Error;
                partial_ += frame.payload;
                if (partial_.size() > ws::kMaxMessageBytes) return ReadStatus::Error;
                if (frame.fin) {
                    out = std::move(partial_);
                    partial_.clear();
                    fragmented_ = false;
                    return ReadStatus::Message;
                }
                break;

            case ws::kOpPing:
                if (!send_frame(ws::kOpPong, frame.payload)) return ReadStatus::Error;
                break;

            case ws::kOpPong:
                break;

            case ws::kOpClose:
                if (!close_sent_.exchange(true))
                    send_frame(ws::kOpClose, frame.payload.substr(0, 2));
                return ReadStatus::Closed;

            default:
                return ReadStatus::Error;
        }
    }
}

void WebSocketTransport::close() {
    if (upgraded_ && !closed_ && !close_sent_) {
        // Best effort: one non-blocking write of a normal-closure frame.
        std::unique_lock<std::mutex> io(io_mutex_, std::try_to_lock);
        uint8_t mask[4];
        if (io.owns_lock() && RAND_bytes(mask, sizeof(mask)) == 1 &&
            !close_sent_.exchange(true)) {
            std::string frame = ws::encode_frame(ws::kOpClose, std::string("\x03\xE8", 2), mask);
            if (ssl_) {
                SSL_write(ssl_, frame.data(), static_cast<int>(frame.size()));
            } else if (fd_ >= 0) {
                ssize_t sent = ::send(fd_, frame.data(), frame.size(),
                                      MSG_NOSIGNAL | MSG_DONTWAIT);
                (void)sent;
            }
        }
    }

    std::lock_guard<std::mutex> lock(fd_mutex_);
    closed_ = true;
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

} // namespace clawlink
