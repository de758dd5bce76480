#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

namespace clawlink {

// SSH local port forward: 127.0.0.1:local_port -> remote_host:remote_port
// as seen from the SSH server.
struct TunnelConfig {
    std::string ssh_user;
    std::string ssh_host;
    uint16_t ssh_port = 22;
    std::string ssh_password;          // plaintext; empty = agent/key auth
    uint16_t local_port = 0;
    std::string remote_host = "127.0.0.1";
    uint16_t remote_port = 0;
    std::string known_hosts_path;      // empty = ~/.ssh/known_hosts
    std::vector<std::string> identity_files; // empty = ~/.ssh/id_ed25519, id_rsa

    bool operator==(const TunnelConfig& other) const;
    bool operator!=(const TunnelConfig& other) const { return !(*this == other); }
};

// Parse "host" or "host:port" (ssh_server config value).
bool parse_ssh_server(const std::string& value, std::string& host, uint16_t& port);

struct LocalEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    uint64_t lease = 0;   // identifies this forward for TunnelManager::release()
};

enum class TunnelErrorKind {
    AuthFailure,      // credentials or host key rejected; not retried
    NetworkFailure,   // SSH server unreachable or session dropped
    PortInUse,        // local forward port already bound
    Cancelled,        // close() called while open() was still negotiating
};

class TunnelError : public std::runtime_error {
public:
    TunnelError(TunnelErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    TunnelErrorKind kind() const { return kind_; }

private:
    TunnelErrorKind kind_;
};

const char* tunnel_error_kind_name(TunnelErrorKind kind);

// An established forward. close() must be idempotent.
class Tunnel {
public:
    virtual ~Tunnel() = default;
    virtual void close() = 0;
    virtual bool alive() const = 0;
};

// Set by TunnelManager::close() to abandon an open() in progress.
class TunnelCancel {
public:
    void cancel();
    bool cancelled() const;

    // True as soon as cancelled; false once `timeout` passes.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

// Establishes a forward or throws TunnelError. Long waits must give up with
// TunnelErrorKind::Cancelled once `cancel` fires.
using TunnelOpener =
    std::function<std::unique_ptr<Tunnel>(const TunnelConfig&, const TunnelCancel& cancel)>;

// libssh2-backed forward. One background thread polls the local listener,
// the SSH socket and every accepted client, and pumps direct-tcpip channels.
class SshTunnel : public Tunnel {
    struct Key { explicit Key() = default; };

public:
    // Connect, verify the host key, authenticate and bind the local port.
    // Every network wait is a short poll() that also watches `cancel`.
    // Throws TunnelError; partially acquired resources are released.
    static std::unique_ptr<SshTunnel> open(const TunnelConfig& config,
                                           const TunnelCancel& cancel);

    SshTunnel(Key, TunnelConfig config, const TunnelCancel& cancel);
    ~SshTunnel() override;

    SshTunnel(const SshTunnel&) = delete;
    SshTunnel& operator=(const SshTunnel&) = delete;

    void close() override;
    bool alive() const override { return alive_; }

private:
    void check_cancel() const;
    void wait_socket();
    template <typename Step> int drive(Step step);

    void connect_socket();
    void handshake();
    void verify_host_key();
    void authenticate();
    void bind_listener();
    void run();

    TunnelConfig config_;
    const TunnelCancel* cancel_;       // only used while open() runs
    long deadline_ms_ = 0;             // end of the current setup phase
    int ssh_fd_ = -1;
    int listen_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};
    LIBSSH2_SESSION* session_ = nullptr;
    std::thread worker_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> alive_{false};
    bool closed_ = false;
};

// Owns at most one forward. open() calls are serialized with each other;
// close() cancels an open() still negotiating instead of waiting for it.
class TunnelManager {
public:
    TunnelManager();
    explicit TunnelManager(TunnelOpener opener);
    ~TunnelManager();

    TunnelManager(const TunnelManager&) = delete;
    TunnelManager& operator=(const TunnelManager&) = delete;

    // Same config while open returns the existing endpoint; a different
    // config replaces the forward. Throws TunnelError.
    LocalEndpoint open(const TunnelConfig& config);

    // Close whatever is open and cancel a pending open(). No-op when idle.
    void close();

    // Close the forward only if it is still the one `lease` was issued for.
    void release(uint64_t lease);

    bool is_open() const;
    std::optional<LocalEndpoint> endpoint() const;

private:
    void shut(std::unique_ptr<Tunnel> tunnel, uint16_t port);

    std::mutex open_mutex_;
    mutable std::mutex mutex_;            // guards everything below
    TunnelOpener opener_;
    std::unique_ptr<Tunnel> tunnel_;
    TunnelConfig config_;
    LocalEndpoint endpoint_;
    std::shared_ptr<TunnelCancel> pending_;
    uint64_t next_lease_ = 0;
};

} // namespace clawlink
