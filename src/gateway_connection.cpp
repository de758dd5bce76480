#include "gateway_connection.hpp"
#include "secret_store.hpp"
#include "util.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <chrono>
#include <iostream>

namespace clawlink {

namespace {

constexpr long kReadSliceMs = 1000;

void wipe(std::string& s) {
    if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
    s.clear();
}

} // namespace

bool ConnectionSnapshot::supports(const std::string& method) const {
    return std::find(features.begin(), features.end(), method) != features.end();
}

GatewayConnection::GatewayConnection(ConnectionConfig config,
                                     TransportFactory transport_factory,
                                     Scheduler& scheduler, EventBus& bus,
                                     SecretStore* secrets, TunnelManager* tunnels)
    : transport_factory_(std::move(transport_factory)),
      scheduler_(scheduler),
      bus_(bus),
      secrets_(secrets),
      tunnels_(tunnels),
      config_(std::move(config)),
      backoff_(config_.tuning.backoff)
{}

GatewayConnection::~GatewayConnection() {
    disconnect();
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        threads = std::move(retired_threads_);
        if (attempt_thread_.joinable()) threads.push_back(std::move(attempt_thread_));
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}

// ── Lifecycle ──────────────────────────────────────────────────

void GatewayConnection::connect() {
    std::optional<ConnectionStateChangedEvent> ev;
    uint64_t gen;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Disconnected && state_ != ConnectionState::Failed)
            return;
        gen = ++generation_;
        auth_failures_ = 0;
        backoff_ = Backoff(config_.tuning.backoff);
        last_error_.clear();
        ev = set_state_locked(ConnectionState::Connecting, "connect requested");
    }
    publish_state(ev);
    launch_attempt(gen);
}

void GatewayConnection::disconnect() {
    std::shared_ptr<Transport> transport;
    std::optional<ConnectionStateChangedEvent> ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_; // stale attempts and timers can no longer transition
        cancel_timers_locked();
        transport = transport_;
        transport_.reset();
        restart_floor_ms_ = 0;
        backoff_ = Backoff(config_.tuning.backoff);
        ev = set_state_locked(ConnectionState::Disconnected, "disconnect requested");
    }
    if (transport) transport->close(); // unblocks a dial, auth wait or read
    if (tunnels_) tunnels_->close();   // also abandons an open in progress

    for (auto& t : retire_attempt_thread()) t.join();
    publish_state(ev);
}

void GatewayConnection::update_config(ConnectionConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
}

ConnectionState GatewayConnection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ConnectionSnapshot GatewayConnection::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionSnapshot snap;
    snap.state = state_;
    snap.endpoint = endpoint_;
    snap.queued = queue_.size();
    snap.auth_failures = auth_failures_;
    snap.reconnect_attempt = backoff_.attempt();
    snap.protocol = protocol_;
    snap.features = features_;
    snap.last_error = last_error_;
    return snap;
}

// ── Attempt ────────────────────────────────────────────────────

void GatewayConnection::launch_attempt(uint64_t gen) {
    std::vector<std::thread> finished = retire_attempt_thread();
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        if (attempt_thread_.joinable()) retired_threads_.push_back(std::move(attempt_thread_));
        attempt_thread_ = std::thread([this, gen] {
            run_attempt(gen);
            std::lock_guard<std::mutex> done(thread_mutex_);
            finished_threads_.push_back(std::this_thread::get_id());
        });
    }
    for (auto& t : finished) t.join();
}

std::vector<std::thread> GatewayConnection::retire_attempt_thread() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (attempt_thread_.joinable()) retired_threads_.push_back(std::move(attempt_thread_));

    std::vector<std::thread> finished;
    auto self = std::this_thread::get_id();
    for (auto it = retired_threads_.begin(); it != retired_threads_.end();) {
        auto done = std::find(finished_threads_.begin(), finished_threads_.end(), it->get_id());
        if (done == finished_threads_.end() || it->get_id() == self) {
            ++it;
            continue;
        }
        finished_threads_.erase(done);
        finished.push_back(std::move(*it));
        it = retired_threads_.erase(it);
    }
    return finished;
}

void GatewayConnection::run_attempt(uint64_t gen) {
    ConnectionConfig cfg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen != generation_) return;
        cfg = config_;
    }

    AttemptResources res;
    std::string url = cfg.endpoint_url;

    // Tunnel strictly before the dial
    if (cfg.tunnel && tunnels_) {
        TunnelConfig tc = *cfg.tunnel;
        try {
            tc.ssh_password = reveal(tc.ssh_password);
        } catch (const SecretError& e) {
            finish_attempt(gen, Outcome::Fail,
                           std::string("SSH password unavailable: ") + e.what(), res);
            return;
        }
        if (!is_current(gen)) return;

        try {
            LocalEndpoint local = tunnels_->open(tc);
            res.tunnel_lease = local.lease;
            url = rewrite_url_endpoint(url, local.host, local.port);
        } catch (const TunnelError& e) {
            wipe(tc.ssh_password);
            Outcome outcome = e.kind() == TunnelErrorKind::AuthFailure ? Outcome::Fail
                                                                        : Outcome::Retry;
            finish_attempt(gen, outcome,
                           std::string("tunnel ") + tunnel_error_kind_name(e.kind()) +
                           ": " + e.what(),
                           res);
            return;
        }
        wipe(tc.ssh_password);
        if (!is_current(gen)) {
            finish_attempt(gen, Outcome::Retry, "superseded", res);
            return;
        }
    }

    AuthParams auth;
    auth.min_protocol = cfg.tuning.min_protocol;
    auth.max_protocol = cfg.tuning.max_protocol;
    try {
        std::string secret = reveal(cfg.credential.value);
        if (cfg.credential.kind == CredentialKind::Password)
            auth.password = std::move(secret);
        else
            auth.token = std::move(secret);
    } catch (const SecretError& e) {
        finish_attempt(gen, Outcome::Fail,
                       std::string("credential unavailable: ") + e.what(), res);
        return;
    }

    res.transport = std::shared_ptr<Transport>(transport_factory_());
    if (!res.transport) {
        wipe(auth.token);
        wipe(auth.password);
        finish_attempt(gen, Outcome::Retry, "no transport available", res);
        return;
    }

    bool stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale = gen != generation_;
        if (!stale) {
            transport_ = res.transport;
            endpoint_ = url;
            close_reason_.clear();
        }
    }

    std::string error;
    if (stale || !res.transport->open(url, cfg.tuning.connect_timeout_ms, error)) {
        wipe(auth.token);
        wipe(auth.password);
        finish_attempt(gen, Outcome::Retry, "connect to " + url + " failed: " + error, res);
        return;
    }

    std::optional<ConnectionStateChangedEvent> ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen == generation_) ev = set_state_locked(ConnectionState::Authenticating, "");
    }
    publish_state(ev);

    std::string auth_frame = codec::encode_auth(auth);
    wipe(auth.token);
    wipe(auth.password);
    bool sent = send_frame(res.transport, auth_frame);
    wipe(auth_frame);
    if (!sent) {
        finish_attempt(gen, Outcome::Retry, "failed to send auth frame", res);
        return;
    }

    // Wait for the ack
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(cfg.tuning.auth_timeout_ms);
    InboundFrame ack;
    bool acked = false;
    while (!acked) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            finish_attempt(gen, Outcome::Retry, "timed out waiting for auth ack", res);
            return;
        }

        std::string raw;
        ReadStatus st = res.transport->receive(raw, static_cast<long>(remaining));
        if (st == ReadStatus::Timeout) continue;
        if (st != ReadStatus::Message) {
            finish_attempt(gen, Outcome::Retry,
                           st == ReadStatus::Closed ? "connection closed during auth"
                                                    : "transport error during auth",
                           res);
            return;
        }

        DecodeResult decoded = codec::decode(raw);
        if (!decoded.frame) {
            std::cerr << "[codec] Dropping malformed frame: " << decoded.error << "\n";
            continue;
        }
        switch (decoded.frame->type) {
            case FrameType::AuthOk:
            case FrameType::AuthError:
                ack = *decoded.frame;
                acked = true;
                break;
            case FrameType::Ping:
                if (!send_frame(res.transport, codec::encode_pong()))
                    std::cerr << "[gateway] Failed to answer ping\n";
                break;
            default:
                break; // nothing else is meaningful before the ack
        }
    }

    if (ack.type == FrameType::AuthError) {
        std::string reason = ack.text.empty() ? "authentication rejected" : ack.text;
        AuthRejectedEvent rejected;
        uint32_t limit;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stale = gen != generation_;
            limit = std::max<uint32_t>(1, config_.tuning.max_auth_failures);
            if (!stale) rejected.consecutive = ++auth_failures_;
        }
        if (stale) {
            finish_attempt(gen, Outcome::Retry, "", res);
            return;
        }
        rejected.reason = reason;
        rejected.final = rejected.consecutive >= limit;
        std::cerr << "[gateway] Auth rejected (" << rejected.consecutive << "/" << limit
                  << "): " << reason << "\n";
        bus_.publish(rejected);
        finish_attempt(gen, rejected.final ? Outcome::Fail : Outcome::Retry,
                       "auth rejected: " + reason, res);
        return;
    }

    if (ack.protocol != 0 &&
        (ack.protocol < cfg.tuning.min_protocol || ack.protocol > cfg.tuning.max_protocol)) {
        finish_attempt(gen, Outcome::Fail,
                       "protocol mismatch: gateway speaks v" + std::to_string(ack.protocol) +
                       ", client supports v" + std::to_string(cfg.tuning.min_protocol) +
                       "-v" + std::to_string(cfg.tuning.max_protocol),
                       res);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen == generation_) {
            auth_failures_ = 0;
            missed_pongs_ = 0;
            protocol_ = ack.protocol != 0 ? ack.protocol : cfg.tuning.max_protocol;
            features_ = ack.features;
            last_error_.clear();
            ev = set_state_locked(ConnectionState::Connected, "authenticated");
            heartbeat_task_ = scheduler_.schedule_after(
                std::chrono::milliseconds(cfg.tuning.heartbeat_interval_ms),
                [this, gen] { on_heartbeat(gen); });
            stability_task_ = scheduler_.schedule_after(
                std::chrono::milliseconds(cfg.tuning.stability_window_ms),
                [this, gen] { on_stable(gen); });
        } else {
            ev.reset();
        }
    }
    publish_state(ev);

    flush_queue(gen);
    std::string reason = reader_loop(gen, res.transport);
    finish_attempt(gen, Outcome::Retry, reason, res);
}

std::string GatewayConnection::reader_loop(uint64_t gen,
                                           const std::shared_ptr<Transport>& transport) {
    while (is_current(gen)) {
        std::string raw;
        ReadStatus st = transport->receive(raw, kReadSliceMs);
        if (st == ReadStatus::Timeout) continue;
        if (st != ReadStatus::Message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!close_reason_.empty()) return close_reason_;
            return st == ReadStatus::Closed ? "connection closed by gateway" : "transport error";
        }

        DecodeResult decoded = codec::decode(raw);
        if (!decoded.frame) {
            std::cerr << "[codec] Dropping malformed frame: " << decoded.error << "\n";
            continue;
        }

        const InboundFrame& frame = *decoded.frame;
        switch (frame.type) {
            case FrameType::Ping:
                if (!send_frame(transport, codec::encode_pong()))
                    std::cerr << "[gateway] Failed to answer ping\n";
                break;
            case FrameType::Pong: {
                std::lock_guard<std::mutex> lock(mutex_);
                missed_pongs_ = 0;
                break;
            }
            case FrameType::Delta:
            case FrameType::End:
            case FrameType::Error:
            case FrameType::History: {
                if (!is_current(gen)) return "superseded";
                FrameReceivedEvent ev;
                ev.frame = frame;
                bus_.publish(ev);
                break;
            }
            case FrameType::Shutdown: {
                std::lock_guard<std::mutex> lock(mutex_);
                restart_floor_ms_ = frame.restart_expected_ms;
                return frame.text.empty() ? "gateway shutting down"
                                          : "gateway shutting down: " + frame.text;
            }
            case FrameType::AuthOk:
            case FrameType::AuthError:
                std::cerr << "[gateway] Ignoring unexpected "
                          << codec::frame_type_name(frame.type) << " frame\n";
                break;
            case FrameType::Unknown:
                break;
        }
    }
    return "";
}

void GatewayConnection::finish_attempt(uint64_t gen, Outcome outcome,
                                       const std::string& reason, AttemptResources& res) {
    // Socket first, then the tunnel
    if (res.transport) {
        res.transport->close();
        std::lock_guard<std::mutex> lock(mutex_);
        if (transport_ == res.transport) transport_.reset();
    }
    // Only the forward this attempt opened; a newer attempt may own another
    if (res.tunnel_lease && tunnels_) {
        tunnels_->release(*res.tunnel_lease);
        res.tunnel_lease.reset();
    }

    std::optional<ConnectionStateChangedEvent> ev;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen != generation_) return;
        cancel_timers_locked();
        last_error_ = reason;
        if (outcome == Outcome::Fail) {
            ev = set_state_locked(ConnectionState::Failed, reason);
        } else {
            delay = backoff_.next_delay();
            if (restart_floor_ms_ > static_cast<uint64_t>(delay.count()))
                delay = std::chrono::milliseconds(restart_floor_ms_);
            restart_floor_ms_ = 0;
            ev = set_state_locked(ConnectionState::Reconnecting, reason);
            backoff_task_ = scheduler_.schedule_after(delay, [this, gen] {
                on_backoff_elapsed(gen);
            });
        }
    }

    if (outcome == Outcome::Retry)
        std::cerr << "[gateway] Retrying in " << delay.count() << "ms\n";
    publish_state(ev);
}

// ── Timers ─────────────────────────────────────────────────────

void GatewayConnection::on_backoff_elapsed(uint64_t gen) {
    uint64_t next;
    std::optional<ConnectionStateChangedEvent> ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen != generation_ || state_ != ConnectionState::Reconnecting) return;
        backoff_task_ = 0;
        next = ++generation_;
        ev = set_state_locked(ConnectionState::Connecting,
                              "retry " + std::to_string(backoff_.attempt()));
    }
    publish_state(ev);
    launch_attempt(next);
}

void GatewayConnection::on_heartbeat(uint64_t gen) {
    std::shared_ptr<Transport> transport;
    uint32_t limit;
    bool timed_out = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (gen != generation_ || state_ != ConnectionState::Connected || !transport_)
            return;
        heartbeat_task_ = 0;
        transport = transport_;
        limit = std::max<uint32_t>(1, config_.tuning.missed_pong_limit);
        if (missed_pongs_ >= limit) {
            timed_out = true;
            close_reason_ = "heartbeat timeout";
        } else {
            ++missed_pongs_;
            heartbeat_task_ = scheduler_.schedule_after(
                std::chrono::milliseconds(config_.tuning.heartbeat_interval_ms),
                [this, gen] { on_heartbeat(gen); });
        }
    }

    if (timed_out) {
        std::cerr << "[gateway] No pong after " << limit << " pings\n";
        transport->close(); // reader loop turns this into a reconnect
        return;
    }
    if (!send_frame(transport, codec::encode_ping()))
        std::cerr << "[gateway] Failed to send ping\n";
}

void GatewayConnection::on_stable(uint64_t gen) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (gen != generation_ || state_ != ConnectionState::Connected) return;
    stability_task_ = 0;
    if (backoff_.attempt() > 0)
        std::cerr << "[gateway] Connection stable, backoff reset\n";
    backoff_.reset();
}

void GatewayConnection::cancel_timers_locked() {
    for (TaskId* id : {&backoff_task_, &heartbeat_task_, &stability_task_, &flush_task_}) {
        if (*id != 0) scheduler_.cancel(*id);
        *id = 0;
    }
}

// ── Outbound ───────────────────────────────────────────────────

void GatewayConnection::enqueue(const std::string& session_id, const std::string& payload) {
    std::optional<QueueOverflowEvent> overflow;
    bool connected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t capacity = std::max<size_t>(1, config_.tuning.queue_capacity);
        if (queue_.size() >= capacity) {
            QueueOverflowEvent ev;
            ev.session_id = queue_.front().session_id;
            overflow = ev;
            queue_.pop_front();
        }
        OutboundEntry entry;
        entry.id = next_entry_id_++;
        entry.session_id = session_id;
        entry.payload = payload;
        entry.enqueued_at = epoch_millis();
        queue_.push_back(std::move(entry));
        connected = state_ == ConnectionState::Connected;
    }

    if (overflow) {
        std::cerr << "[gateway] Outbound queue full, dropped oldest frame of "
                  << overflow->session_id << "\n";
        bus_.publish(*overflow);
    }
    if (connected) schedule_flush();
}

void GatewayConnection::schedule_flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected || flush_task_ != 0) return;
    uint64_t gen = generation_;
    flush_task_ = scheduler_.schedule_after(std::chrono::milliseconds(0), [this, gen] {
        {
            std::lock_guard<std::mutex> inner(mutex_);
            if (gen == generation_) flush_task_ = 0;
        }
        flush_queue(gen);
    });
}

// Entries leave the queue only once written, in enqueue order.
void GatewayConnection::flush_queue(uint64_t gen) {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    while (true) {
        std::shared_ptr<Transport> transport;
        OutboundEntry entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (gen != generation_ || state_ != ConnectionState::Connected ||
                queue_.empty() || !transport_)
                return;
            entry = queue_.front();
            transport = transport_;
        }

        if (!transport->send_text(entry.payload)) {
            std::cerr << "[gateway] Send failed, " << "keeping queued frames\n";
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (close_reason_.empty()) close_reason_ = "send failed";
            }
            transport->close();
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty() && queue_.front().id == entry.id) queue_.pop_front();
    }
}

bool GatewayConnection::send_frame(const std::shared_ptr<Transport>& transport,
                                   const std::string& payload) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return transport->send_text(payload);
}

// ── Helpers ────────────────────────────────────────────────────

std::string GatewayConnection::reveal(const std::string& value) const {
    if (!SecretStore::is_encrypted(value)) return value;
    if (!secrets_)
        throw SecretError(SecretErrorKind::KeyMissing, "no key store to decrypt credential");
    return secrets_->reveal(value);
}

bool GatewayConnection::is_current(uint64_t gen) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gen == generation_;
}

std::optional<ConnectionStateChangedEvent>
GatewayConnection::set_state_locked(ConnectionState next, const std::string& reason) {
    if (state_ == next) return std::nullopt;
    ConnectionStateChangedEvent ev;
    ev.previous = state_;
    ev.current = next;
    ev.reason = reason;
    ev.sequence = ++state_sequence_;
    state_ = next;
    return ev;
}

void GatewayConnection::publish_state(const std::optional<ConnectionStateChangedEvent>& ev) {
    if (!ev) return;
    std::lock_guard<std::mutex> lock(publish_mutex_);
    if (ev->sequence <= published_sequence_) return; // a newer transition went out first
    published_sequence_ = ev->sequence;
    std::cerr << "[gateway] " << connection_state_name(ev->previous) << " -> "
              << connection_state_name(ev->current);
    if (!ev->reason.empty()) std::cerr << " (" << ev->reason << ")";
    std::cerr << "\n";
    bus_.publish(*ev);
}

} // namespace clawlink
