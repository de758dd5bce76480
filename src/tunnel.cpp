#include "tunnel.hpp"
#include "util.hpp"

#include <libssh2.h>

#include <sys/socket.h>
#include <sys/stat.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace clawlink {

namespace {

constexpr int kConnectTimeoutMs = 10000;
constexpr long kSessionTimeoutMs = 15000;
constexpr int kKeepaliveSecs = 30;
constexpr int kPollSliceMs = 100;
constexpr size_t kMaxBuffered = 256 * 1024;

long steady_ms() {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

bool libssh2_ready() {
    static const bool ok = libssh2_init(0) == 0;
    return ok;
}

bool is_socket_error(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_TIMEOUT ||
           rc == LIBSSH2_ERROR_TIMEOUT;
}

std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown error";
}

int knownhost_key_type(int hostkey_type) {
    switch (hostkey_type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
        default:                             return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

bool parse_port(const std::string& s, uint16_t& port) {
    if (s.empty() || s.size() > 5 ||
        !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
        return false;
    unsigned long v = std::stoul(s);
    if (v == 0 || v > 65535) return false;
    port = static_cast<uint16_t>(v);
    return true;
}

struct Forward {
    int fd = -1;
    LIBSSH2_CHANNEL* channel = nullptr;
    std::string to_remote;   // read from the local client, not yet written to the channel
    std::string to_local;    // read from the channel, not yet sent to the client
    bool client_eof = false;
    bool eof_sent = false;
    bool done = false;
};

} // namespace

// ── TunnelConfig ───────────────────────────────────────────────

bool TunnelConfig::operator==(const TunnelConfig& o) const {
    return ssh_user == o.ssh_user && ssh_host == o.ssh_host &&
           ssh_port == o.ssh_port && ssh_password == o.ssh_password &&
           local_port == o.local_port && remote_host == o.remote_host &&
           remote_port == o.remote_port && known_hosts_path == o.known_hosts_path &&
           identity_files == o.identity_files;
}

bool parse_ssh_server(const std::string& value, std::string& host, uint16_t& port) {
    std::string v = trim(value);
    if (v.empty()) return false;

    port = 22;
    if (v[0] == '[') {
        size_t close = v.find(']');
        if (close == std::string::npos || close == 1) return false;
        host = v.substr(1, close - 1);
        if (close + 1 == v.size()) return true;
        if (v[close + 1] != ':') return false;
        return parse_port(v.substr(close + 2), port);
    }

    size_t colon = v.find(':');
    if (colon == std::string::npos || v.find(':', colon + 1) != std::string::npos) {
        host = v; // plain host, or a bare IPv6 address
        return true;
    }
    host = v.substr(0, colon);
    if (host.empty()) return false;
    return parse_port(v.substr(colon + 1), port);
}

const char* tunnel_error_kind_name(TunnelErrorKind kind) {
    switch (kind) {
        case TunnelErrorKind::AuthFailure:    return "auth failure";
        case TunnelErrorKind::NetworkFailure: return "network failure";
        case TunnelErrorKind::PortInUse:      return "port in use";
        case TunnelErrorKind::Cancelled:      return "cancelled";
    }
    return "unknown";
}

// ── TunnelCancel ───────────────────────────────────────────────

void TunnelCancel::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool TunnelCancel::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool TunnelCancel::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}

// ── SshTunnel ──────────────────────────────────────────────────

SshTunnel::SshTunnel(Key, TunnelConfig config, const TunnelCancel& cancel)
    : config_(std::move(config)), cancel_(&cancel) {
    if (config_.known_hosts_path.empty())
        config_.known_hosts_path = expand_home("~/.ssh/known_hosts");
    if (config_.identity_files.empty()) {
        config_.identity_files = {expand_home("~/.ssh/id_ed25519"),
                                  expand_home("~/.ssh/id_rsa")};
    }
}

SshTunnel::~SshTunnel() {
    close();
}

std::unique_ptr<SshTunnel> SshTunnel::open(const TunnelConfig& config,
                                           const TunnelCancel& cancel) {
    if (!libssh2_ready())
        throw TunnelError(TunnelErrorKind::NetworkFailure, "libssh2 initialisation failed");

    // Destructor releases whatever was acquired if a step throws.
    auto tunnel = std::make_unique<SshTunnel>(Key{}, config, cancel);
    tunnel->deadline_ms_ = steady_ms() + kConnectTimeoutMs;
    tunnel->connect_socket();
    tunnel->deadline_ms_ = steady_ms() + kSessionTimeoutMs;
    tunnel->handshake();
    tunnel->verify_host_key();
    tunnel->authenticate();
    tunnel->check_cancel();
    tunnel->bind_listener();
    tunnel->cancel_ = nullptr;

    if (::pipe(tunnel->wake_pipe_) != 0)
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          std::string("pipe: ") + std::strerror(errno));
    fcntl(tunnel->wake_pipe_[0], F_SETFL, O_NONBLOCK);

    libssh2_keepalive_config(tunnel->session_, 1, kKeepaliveSecs);

    tunnel->alive_ = true;
    SshTunnel* raw = tunnel.get();
    tunnel->worker_ = std::thread([raw] { raw->run(); });

    std::cerr << "[tunnel] Forwarding 127.0.0.1:" << config.local_port << " -> "
              << config.remote_host << ":" << config.remote_port << " via "
              << config.ssh_user << "@" << config.ssh_host << ":" << config.ssh_port << "\n";
    return tunnel;
}

void SshTunnel::check_cancel() const {
    if (cancel_ && cancel_->cancelled())
        throw TunnelError(TunnelErrorKind::Cancelled, "tunnel open cancelled");
}

// One poll slice on the SSH socket in whichever direction libssh2 is waiting.
void SshTunnel::wait_socket() {
    check_cancel();
    long left = deadline_ms_ - steady_ms();
    if (left <= 0) {
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          "SSH negotiation with " + config_.ssh_host + " timed out");
    }

    struct pollfd pfd{};
    pfd.fd = ssh_fd_;
    int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) pfd.events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) pfd.events |= POLLOUT;
    if (pfd.events == 0) pfd.events = POLLIN;
    ::poll(&pfd, 1, static_cast<int>(std::min<long>(left, kPollSliceMs)));
}

// Repeats a non-blocking libssh2 call until it stops returning EAGAIN.
template <typename Step>
int SshTunnel::drive(Step step) {
    while (true) {
        int rc = step();
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        wait_socket();
    }
}

void SshTunnel::connect_socket() {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port = std::to_string(config_.ssh_port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(config_.ssh_host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) {
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          "cannot resolve " + config_.ssh_host + ": " + gai_strerror(gai));
    }

    for (auto* ai = res; ai && ssh_fd_ < 0; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        bool connected = false;
        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            connected = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            while (!connected && steady_ms() < deadline_ms_) {
                if (cancel_ && cancel_->cancelled()) break;
                int n = ::poll(&pfd, 1, kPollSliceMs);
                if (n < 0 && errno != EINTR) break;
                if (n <= 0) continue;
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                connected = (err == 0);
                break;
            }
        }
        if (connected) {
            ssh_fd_ = fd;
        } else {
            ::close(fd);
        }
    }
    freeaddrinfo(res);
    check_cancel();

    if (ssh_fd_ < 0) {
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          "cannot connect to SSH server " + config_.ssh_host + ":" + port);
    }
}

void SshTunnel::handshake() {
    session_ = libssh2_session_init();
    if (!session_)
        throw TunnelError(TunnelErrorKind::NetworkFailure, "could not initialise SSH session");

    libssh2_session_set_blocking(session_, 0);

    int rc = drive([this] { return libssh2_session_handshake(session_, ssh_fd_); });
    if (rc != 0) {
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          "SSH handshake with " + config_.ssh_host + " failed: " +
                          last_error(session_));
    }
}

// Accept-new policy: an unknown host is appended to known_hosts, a changed
// key is refused.
void SshTunnel::verify_host_key() {
    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key || key_len == 0)
        throw TunnelError(TunnelErrorKind::NetworkFailure, "SSH server sent no host key");

    std::unique_ptr<LIBSSH2_KNOWNHOSTS, void (*)(LIBSSH2_KNOWNHOSTS*)> hosts(
        libssh2_knownhost_init(session_), libssh2_knownhost_free);
    if (!hosts)
        throw TunnelError(TunnelErrorKind::NetworkFailure, "could not initialise known_hosts");

    std::error_code ec;
    if (std::filesystem::exists(config_.known_hosts_path, ec)) {
        int n = libssh2_knownhost_readfile(hosts.get(), config_.known_hosts_path.c_str(),
                                           LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        if (n < 0) {
            throw TunnelError(TunnelErrorKind::AuthFailure,
                              "cannot read " + config_.known_hosts_path);
        }
    }

    int typemask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW;
    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(hosts.get(), config_.ssh_host.c_str(),
                                         config_.ssh_port, key, key_len, typemask, &entry);
    switch (check) {
        case LIBSSH2_KNOWNHOST_CHECK_MATCH:
            return;
        case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
            throw TunnelError(TunnelErrorKind::AuthFailure,
                              "host key for " + config_.ssh_host +
                              " does not match known_hosts");
        case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
            break;
        default:
            throw TunnelError(TunnelErrorKind::NetworkFailure,
                              "host key check failed for " + config_.ssh_host);
    }

    std::string host_spec = config_.ssh_port == 22
        ? config_.ssh_host
        : "[" + config_.ssh_host + "]:" + std::to_string(config_.ssh_port);
    struct libssh2_knownhost* added = nullptr;
    if (libssh2_knownhost_addc(hosts.get(), host_spec.c_str(), nullptr, key, key_len,
                               nullptr, 0, typemask | knownhost_key_type(key_type),
                               &added) != 0) {
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          "could not record host key for " + config_.ssh_host);
    }

    char line[4096];
    size_t line_len = 0;
    if (libssh2_knownhost_writeline(hosts.get(), added, line, sizeof(line), &line_len,
                                    LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          "could not format host key for " + config_.ssh_host);
    }

    std::filesystem::path dir = std::filesystem::path(config_.known_hosts_path).parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        ::chmod(dir.c_str(), 0700);
    }
    std::ofstream out(config_.known_hosts_path, std::ios::app);
    out.write(line, static_cast<std::streamsize>(line_len));
    if (!out) {
        std::cerr << "[tunnel] Warning: could not append to "
                  << config_.known_hosts_path << "\n";
    }
    std::cerr << "[tunnel] Added " << host_spec << " to " << config_.known_hosts_path << "\n";
}

void SshTunnel::authenticate() {
    const std::string& user = config_.ssh_user;
    const std::string target = user + "@" + config_.ssh_host;

    char* methods = nullptr;
    while (!(methods = libssh2_userauth_list(session_, user.c_str(),
                                             static_cast<unsigned int>(user.size())))) {
        if (libssh2_userauth_authenticated(session_)) return; // "none" accepted
        int err = libssh2_session_last_errno(session_);
        if (err == LIBSSH2_ERROR_EAGAIN) {
            wait_socket();
            continue;
        }
        throw TunnelError(is_socket_error(err) ? TunnelErrorKind::NetworkFailure
                                               : TunnelErrorKind::AuthFailure,
                          "SSH auth negotiation for " + target + " failed: " +
                          last_error(session_));
    }
    std::string accepted = methods;

    auto fail = [&](const std::string& msg, int rc) {
        if (is_socket_error(rc))
            return TunnelError(TunnelErrorKind::NetworkFailure, msg + ": " + last_error(session_));
        return TunnelError(TunnelErrorKind::AuthFailure, msg);
    };

    if (!config_.ssh_password.empty()) {
        if (accepted.find("password") == std::string::npos)
            throw TunnelError(TunnelErrorKind::AuthFailure,
                              "SSH server does not accept password auth for " + target);
        int rc = drive([&] {
            return libssh2_userauth_password(session_, user.c_str(),
                                             config_.ssh_password.c_str());
        });
        if (rc != 0) throw fail("SSH password rejected for " + target, rc);
        return;
    }

    if (accepted.find("publickey") == std::string::npos)
        throw TunnelError(TunnelErrorKind::AuthFailure,
                          "SSH server does not accept public key auth for " + target);

    // ssh-agent identities first
    if (LIBSSH2_AGENT* agent = libssh2_agent_init(session_)) {
        bool ok = false;
        if (libssh2_agent_connect(agent) == 0) {
            if (libssh2_agent_list_identities(agent) == 0) {
                struct libssh2_agent_publickey* identity = nullptr;
                struct libssh2_agent_publickey* prev = nullptr;
                while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                    int rc = drive([&] {
                        return libssh2_agent_userauth(agent, user.c_str(), identity);
                    });
                    if (rc == 0) {
                        ok = true;
                        break;
                    }
                    prev = identity;
                }
            }
            libssh2_agent_disconnect(agent);
        }
        libssh2_agent_free(agent);
        if (ok) return;
    }

    std::error_code ec;
    for (const auto& key : config_.identity_files) {
        if (!std::filesystem::exists(key, ec)) continue;
        std::string pub = key + ".pub";
        const char* pub_path = std::filesystem::exists(pub, ec) ? pub.c_str() : nullptr;
        int rc = drive([&] {
            return libssh2_userauth_publickey_fromfile(session_, user.c_str(), pub_path,
                                                       key.c_str(), nullptr);
        });
        if (rc == 0) return;
        if (is_socket_error(rc)) throw fail("SSH key auth for " + target + " failed", rc);
    }

    throw TunnelError(TunnelErrorKind::AuthFailure, "no SSH identity accepted for " + target);
}

void SshTunnel::bind_listener() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          std::string("socket: ") + std::strerror(errno));
    listen_fd_ = fd;

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.local_port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno == EADDRINUSE) {
            throw TunnelError(TunnelErrorKind::PortInUse,
                              "local port " + std::to_string(config_.local_port) +
                              " is already in use");
        }
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          std::string("bind: ") + std::strerror(errno));
    }
    if (::listen(fd, 16) != 0)
        throw TunnelError(TunnelErrorKind::NetworkFailure,
                          std::string("listen: ") + std::strerror(errno));

    fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
}

void SshTunnel::run() {
    std::vector<Forward> forwards;
    std::vector<LIBSSH2_CHANNEL*> closing;
    char buf[16384];

    auto lost = [this](const char* what) {
        std::cerr << "[tunnel] SSH session lost (" << what << "): "
                  << last_error(session_) << "\n";
        alive_ = false;
    };

    while (!stop_ && alive_) {
        std::vector<struct pollfd> pfds;
        pfds.push_back({wake_pipe_[0], POLLIN, 0});
        pfds.push_back({listen_fd_, POLLIN, 0});
        pfds.push_back({ssh_fd_, POLLIN, 0});
        for (const auto& f : forwards) {
            short events = f.client_eof ? 0 : POLLIN;
            if (!f.to_local.empty()) events |= POLLOUT;
            pfds.push_back({f.fd, events, 0});
        }

        if (::poll(pfds.data(), pfds.size(), kPollSliceMs) < 0 && errno != EINTR) {
            std::cerr << "[tunnel] poll: " << std::strerror(errno) << "\n";
            alive_ = false;
            break;
        }
        if (pfds[0].revents & POLLIN) break; // close() requested
        if (pfds[2].revents & (POLLERR | POLLHUP)) {
            lost("socket closed");
            break;
        }

        int next_keepalive = 0;
        int ka = libssh2_keepalive_send(session_, &next_keepalive);
        if (ka != 0 && ka != LIBSSH2_ERROR_EAGAIN) {
            lost("keepalive");
            break;
        }

        // Accept new local clients
        while (true) {
            int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) break;
            fcntl(client, F_SETFL, fcntl(client, F_GETFL, 0) | O_NONBLOCK);
            Forward f;
            f.fd = client;
            forwards.push_back(std::move(f));
        }

        for (auto& f : forwards) {
            if (!f.channel) {
                f.channel = libssh2_channel_direct_tcpip_ex(
                    session_, config_.remote_host.c_str(), config_.remote_port,
                    "127.0.0.1", config_.local_port);
                if (!f.channel) {
                    int err = libssh2_session_last_errno(session_);
                    if (err != LIBSSH2_ERROR_EAGAIN) {
                        std::cerr << "[tunnel] Could not open channel to "
                                  << config_.remote_host << ":" << config_.remote_port
                                  << ": " << last_error(session_) << "\n";
                        if (is_socket_error(err)) alive_ = false;
                        f.done = true;
                    }
                    continue;
                }
            }

            // client -> channel
            if (!f.client_eof && f.to_remote.size() < kMaxBuffered) {
                ssize_t n = ::recv(f.fd, buf, sizeof(buf), 0);
                if (n > 0) {
                    f.to_remote.append(buf, static_cast<size_t>(n));
                } else if (n == 0) {
                    f.client_eof = true;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    f.done = true;
                    continue;
                }
            }
            while (!f.to_remote.empty()) {
                ssize_t w = libssh2_channel_write(f.channel, f.to_remote.data(),
                                                  f.to_remote.size());
                if (w == LIBSSH2_ERROR_EAGAIN) break;
                if (w < 0) {
                    if (is_socket_error(static_cast<int>(w))) alive_ = false;
                    f.done = true;
                    break;
                }
                f.to_remote.erase(0, static_cast<size_t>(w));
            }
            if (f.done) continue;
            if (f.client_eof && f.to_remote.empty() && !f.eof_sent) {
                int rc = libssh2_channel_send_eof(f.channel);
                if (rc == 0) f.eof_sent = true;
                else if (rc != LIBSSH2_ERROR_EAGAIN) f.done = true;
            }

            // channel -> client
            while (f.to_local.size() < kMaxBuffered) {
                ssize_t r = libssh2_channel_read(f.channel, buf, sizeof(buf));
                if (r > 0) {
                    f.to_local.append(buf, static_cast<size_t>(r));
                    continue;
                }
                if (r < 0 && r != LIBSSH2_ERROR_EAGAIN) {
                    if (is_socket_error(static_cast<int>(r))) alive_ = false;
                    f.done = true;
                }
                break;
            }
            while (!f.to_local.empty()) {
                ssize_t s = ::send(f.fd, f.to_local.data(), f.to_local.size(), MSG_NOSIGNAL);
                if (s > 0) {
                    f.to_local.erase(0, static_cast<size_t>(s));
                    continue;
                }
                if (s < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    f.done = true;
                break;
            }

            if (libssh2_channel_eof(f.channel) && f.to_local.empty()) f.done = true;
        }

        // Retire finished forwards; channel frees may need several passes
        for (auto& f : forwards) {
            if (!f.done) continue;
            ::close(f.fd);
            f.fd = -1;
            if (f.channel) closing.push_back(f.channel);
            f.channel = nullptr;
        }
        forwards.erase(std::remove_if(forwards.begin(), forwards.end(),
                                      [](const Forward& f) { return f.done; }),
                       forwards.end());
        closing.erase(std::remove_if(closing.begin(), closing.end(),
                                     [](LIBSSH2_CHANNEL* ch) {
                                         return libssh2_channel_free(ch) != LIBSSH2_ERROR_EAGAIN;
                                     }),
                      closing.end());

        if (!alive_) lost("channel I/O");
    }

    // Remaining channels are released with the session.
    for (auto& f : forwards) {
        if (f.fd >= 0) ::close(f.fd);
    }
}

void SshTunnel::close() {
    if (closed_) return;
    closed_ = true;
    stop_ = true;

    if (wake_pipe_[1] >= 0) {
        char c = 1;
        if (::write(wake_pipe_[1], &c, 1) < 0) {
            // poll slice still observes stop_
        }
    }
    if (worker_.joinable()) worker_.join();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (session_) {
        if (alive_) {
            libssh2_session_set_blocking(session_, 1);
            libssh2_session_disconnect(session_, "Normal Shutdown");
        }
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (ssh_fd_ >= 0) {
        ::close(ssh_fd_);
        ssh_fd_ = -1;
    }
    for (int& fd : wake_pipe_) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
    alive_ = false;
}

// ── TunnelManager ──────────────────────────────────────────────

TunnelManager::TunnelManager()
    : opener_([](const TunnelConfig& config,
                 const TunnelCancel& cancel) -> std::unique_ptr<Tunnel> {
          return SshTunnel::open(config, cancel);
      })
{}

TunnelManager::TunnelManager(TunnelOpener opener)
    : opener_(std::move(opener))
{}

TunnelManager::~TunnelManager() {
    close();
}

LocalEndpoint TunnelManager::open(const TunnelConfig& config) {
    std::lock_guard<std::mutex> serial(open_mutex_);

    auto cancel = std::make_shared<TunnelCancel>();
    std::unique_ptr<Tunnel> previous;
    uint16_t previous_port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tunnel_ && config_ == config && tunnel_->alive()) return endpoint_;
        previous = std::move(tunnel_);
        previous_port = endpoint_.port;
        pending_ = cancel;
    }
    if (previous) shut(std::move(previous), previous_port);

    std::unique_ptr<Tunnel> fresh;
    try {
        fresh = opener_(config, *cancel);
    } catch (const TunnelError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ == cancel) pending_.reset();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ == cancel) pending_.reset();
        if (!fresh) {
            throw TunnelError(TunnelErrorKind::NetworkFailure,
                              "tunnel to " + config.ssh_host + " was not established");
        }
        if (!cancel->cancelled()) {
            tunnel_ = std::move(fresh);
            config_ = config;
            endpoint_ = LocalEndpoint{"127.0.0.1", config.local_port, ++next_lease_};
            return endpoint_;
        }
    }
    shut(std::move(fresh), config.local_port);
    throw TunnelError(TunnelErrorKind::Cancelled, "tunnel open cancelled");
}

void TunnelManager::close() {
    std::unique_ptr<Tunnel> tunnel;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_) {
            pending_->cancel();
            pending_.reset();
        }
        tunnel = std::move(tunnel_);
        port = endpoint_.port;
    }
    if (tunnel) shut(std::move(tunnel), port);
}

void TunnelManager::release(uint64_t lease) {
    std::unique_ptr<Tunnel> tunnel;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!tunnel_ || endpoint_.lease != lease) return;
        tunnel = std::move(tunnel_);
        port = endpoint_.port;
    }
    shut(std::move(tunnel), port);
}

void TunnelManager::shut(std::unique_ptr<Tunnel> tunnel, uint16_t port) {
    tunnel->close();
    std::cerr << "[tunnel] Closed forward on 127.0.0.1:" << port << "\n";
}

bool TunnelManager::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tunnel_ != nullptr;
}

std::optional<LocalEndpoint> TunnelManager::endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tunnel_) return std::nullopt;
    return endpoint_;
}

} // namespace clawlink
