#pragma once
#include "backoff.hpp"
#include "codec.hpp"
#include "connection_state.hpp"
#include "event_bus.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include "tunnel.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace clawlink {

class SecretStore;

constexpr const char* kDefaultGatewayUrl = "ws://127.0.0.1:18789";

struct ConnectionTuning {
    long connect_timeout_ms = 10000;
    long auth_timeout_ms = 10000;
    long heartbeat_interval_ms = 20000;
    uint32_t missed_pong_limit = 2;
    BackoffPolicy backoff;
    long stability_window_ms = 30000;
    uint32_t max_auth_failures = 3;
    size_t queue_capacity = 100;
    uint32_t min_protocol = kProtocolVersion;
    uint32_t max_protocol = kProtocolVersion;
};

enum class CredentialKind { Token, Password };

// `value` is the persisted form: "enc:"-marked ciphertext or legacy plaintext.
// It is revealed only inside a connection attempt.
struct Credential {
    CredentialKind kind = CredentialKind::Token;
    std::string value;
};

struct ConnectionConfig {
    std::string endpoint_url = kDefaultGatewayUrl;
    Credential credential;
    bool auto_connect = false;
    std::optional<TunnelConfig> tunnel;   // ssh_password may be "enc:"-marked
    ConnectionTuning tuning;
};

struct ConnectionSnapshot {
    ConnectionState state = ConnectionState::Disconnected;
    std::string endpoint;            // URL actually dialled (tunnel-rewritten)
    size_t queued = 0;
    uint32_t auth_failures = 0;
    uint32_t reconnect_attempt = 0;
    uint32_t protocol = 0;           // negotiated; 0 before the first ack
    std::vector<std::string> features;
    std::string last_error;

    bool supports(const std::string& method) const;
};

// Where sessions hand their outbound frames.
class OutboundSink {
public:
    virtual ~OutboundSink() = default;
    virtual void enqueue(const std::string& session_id, const std::string& payload) = 0;
};

// The single connection to the Gateway: tunnel, transport, auth handshake,
// heartbeat, reconnect with backoff and a bounded outbound queue.
//
// connect() and enqueue() never block on the network. Each attempt runs on
// its own thread, which becomes the reader loop once authenticated. Timers
// run on the injected Scheduler. State changes are published as
// ConnectionStateChangedEvent in the order they happened; a transition that
// loses the race to a newer one is not delivered. Inbound session frames are
// published as FrameReceivedEvent.
//
// disconnect() never waits for an attempt thread. Superseded threads finish
// on their own and are joined later or by the destructor. State handlers must
// not call connect() or disconnect() themselves.
class GatewayConnection : public OutboundSink {
public:
    GatewayConnection(ConnectionConfig config, TransportFactory transport_factory,
                      Scheduler& scheduler, EventBus& bus,
                      SecretStore* secrets = nullptr, TunnelManager* tunnels = nullptr);
    ~GatewayConnection() override;

    GatewayConnection(const GatewayConnection&) = delete;
    GatewayConnection& operator=(const GatewayConnection&) = delete;

    // Disconnected/Failed -> Connecting. No-op while an attempt is active.
    void connect();

    // Any state -> Disconnected. Queued entries are kept. Closes the socket
    // and the tunnel, and cancels a tunnel still being opened.
    void disconnect();

    // Send now if connected, otherwise hold for the next authenticated
    // session. Oldest entry is dropped when the queue is full.
    void enqueue(const std::string& session_id, const std::string& payload) override;

    // Takes effect on the next attempt.
    void update_config(ConnectionConfig config);

    ConnectionState state() const;
    ConnectionSnapshot snapshot() const;

private:
    enum class Outcome { Retry, Fail };

    struct OutboundEntry {
        uint64_t id = 0;
        std::string session_id;
        std::string payload;
        uint64_t enqueued_at = 0;
    };

    struct AttemptResources {
        std::shared_ptr<Transport> transport;
        std::optional<uint64_t> tunnel_lease;
    };

    void launch_attempt(uint64_t gen);
    // Moves the running attempt thread aside. Returns retired threads that
    // have already finished, for the caller to join without thread_mutex_.
    std::vector<std::thread> retire_attempt_thread();
    void run_attempt(uint64_t gen);
    std::string reader_loop(uint64_t gen, const std::shared_ptr<Transport>& transport);
    void finish_attempt(uint64_t gen, Outcome outcome, const std::string& reason,
                        AttemptResources& res);

    void on_backoff_elapsed(uint64_t gen);
    void on_heartbeat(uint64_t gen);
    void on_stable(uint64_t gen);
    void schedule_flush();
    void flush_queue(uint64_t gen);

    bool send_frame(const std::shared_ptr<Transport>& transport, const std::string& payload);
    std::string reveal(const std::string& value) const;
    bool is_current(uint64_t gen) const;

    // Caller holds mutex_. Returns the event to publish after unlocking.
    std::optional<ConnectionStateChangedEvent> set_state_locked(ConnectionState next,
                                                                const std::string& reason);
    void cancel_timers_locked();
    void publish_state(const std::optional<ConnectionStateChangedEvent>& ev);

    TransportFactory transport_factory_;
    Scheduler& scheduler_;
    EventBus& bus_;
    SecretStore* secrets_;
    TunnelManager* tunnels_;

    mutable std::mutex mutex_;
    ConnectionConfig config_;
    ConnectionState state_ = ConnectionState::Disconnected;
    uint64_t generation_ = 0;
    uint64_t state_sequence_ = 0;
    std::shared_ptr<Transport> transport_;
    std::deque<OutboundEntry> queue_;
    uint64_t next_entry_id_ = 1;
    Backoff backoff_;
    uint32_t auth_failures_ = 0;
    uint32_t missed_pongs_ = 0;
    uint32_t protocol_ = 0;
    std::vector<std::string> features_;
    std::string endpoint_;
    std::string last_error_;
    std::string close_reason_;          // set when we close the socket ourselves
    uint64_t restart_floor_ms_ = 0;     // from a shutdown notice
    TaskId backoff_task_ = 0;
    TaskId heartbeat_task_ = 0;
    TaskId stability_task_ = 0;
    TaskId flush_task_ = 0;

    std::mutex send_mutex_;             // one writer path on the transport

    std::mutex publish_mutex_;          // held while a state event is delivered
    uint64_t published_sequence_ = 0;

    std::mutex thread_mutex_;
    std::thread attempt_thread_;
    std::vector<std::thread> retired_threads_;
    std::vector<std::thread::id> finished_threads_;
};

} // namespace clawlink
