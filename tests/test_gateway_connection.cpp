#include <catch2/catch.hpp>
#include "gateway_connection.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "fake_transport.hpp"
#include "fake_tunnel.hpp"
#include "manual_scheduler.hpp"
#include "secret_store.hpp"
#include "session_registry.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace clawlink;
using std::chrono::milliseconds;

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "clawlink_conn_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

template <typename Pred>
static bool wait_for(Pred pred, milliseconds timeout = milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(milliseconds(2));
    }
    return true;
}

// Collects everything the connection publishes
struct Recorder {
    explicit Recorder(EventBus& bus) {
        subscribe<ConnectionStateChangedEvent>(bus, [this](const ConnectionStateChangedEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(ev.current);
        });
        subscribe<AuthRejectedEvent>(bus, [this](const AuthRejectedEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            rejections.push_back(ev);
        });
        subscribe<QueueOverflowEvent>(bus, [this](const QueueOverflowEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            overflows.push_back(ev.session_id);
        });
        subscribe<SessionMessageCompletedEvent>(bus, [this](const SessionMessageCompletedEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            completed.push_back(ev.message);
        });
    }

    size_t count(ConnectionState s) const {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<size_t>(std::count(states.begin(), states.end(), s));
    }

    std::vector<ConnectionState> history() const {
        std::lock_guard<std::mutex> lock(mutex);
        return states;
    }

    std::vector<AuthRejectedEvent> rejected() const {
        std::lock_guard<std::mutex> lock(mutex);
        return rejections;
    }

    std::vector<Message> completed_messages() const {
        std::lock_guard<std::mutex> lock(mutex);
        return completed;
    }

    mutable std::mutex mutex;
    std::vector<ConnectionState> states;
    std::vector<AuthRejectedEvent> rejections;
    std::vector<std::string> overflows;
    std::vector<Message> completed;
};

// Declaration order matters: the connection goes first on teardown and may
// still publish to the recorder and close the tunnel manager.
struct Harness {
    EventBus bus;
    ManualScheduler sched;
    FakeGateway gw;
    Recorder rec{bus};
    FakeTunnelOpener tunnel_opener{gw.log};
    std::unique_ptr<TunnelManager> tunnels;
    std::unique_ptr<GatewayConnection> conn;

    void start(ConnectionConfig cfg, SecretStore* secrets = nullptr, bool with_tunnels = false) {
        if (with_tunnels) tunnels = std::make_unique<TunnelManager>(tunnel_opener.opener());
        conn = std::make_unique<GatewayConnection>(std::move(cfg), gw.factory(), sched, bus,
                                                   secrets, tunnels.get());
    }

    bool wait_state(ConnectionState s) {
        return wait_for([&] { return conn->state() == s; });
    }

    ~Harness() { conn.reset(); }
};

static ConnectionConfig base_config() {
    ConnectionConfig cfg;
    cfg.endpoint_url = "ws://gateway.test:18789/ws";
    cfg.credential.kind = CredentialKind::Token;
    cfg.credential.value = "tok-123";
    cfg.tuning.backoff.initial_ms = 1000;
    cfg.tuning.backoff.max_ms = 60000;
    cfg.tuning.backoff.multiplier = 2.0;
    cfg.tuning.backoff.jitter = 0.0;
    cfg.tuning.heartbeat_interval_ms = 600000;
    cfg.tuning.stability_window_ms = 30000;
    cfg.tuning.auth_timeout_ms = 2000;
    return cfg;
}

// ── Connect and authenticate ─────────────────────────────────────

TEST_CASE("GatewayConnection::connect: authenticates before Connected", "[connection]") {
    Harness h;
    h.start(base_config());
    REQUIRE(h.conn->state() == ConnectionState::Disconnected);

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    REQUIRE(h.rec.history() == std::vector<ConnectionState>{
        ConnectionState::Connecting, ConnectionState::Authenticating, ConnectionState::Connected});

    auto auths = h.gw.sent_of_type("auth");
    REQUIRE(auths.size() == 1);
    REQUIRE(auths[0]["token"] == "tok-123");
    REQUIRE_FALSE(auths[0].contains("password"));
    REQUIRE(auths[0]["minProtocol"] == kProtocolVersion);
    REQUIRE(h.gw.opened_urls() == std::vector<std::string>{"ws://gateway.test:18789/ws"});

    auto snap = h.conn->snapshot();
    REQUIRE(snap.endpoint == "ws://gateway.test:18789/ws");
    REQUIRE(snap.protocol == 3);
    REQUIRE(snap.last_error.empty());
}

TEST_CASE("GatewayConnection::connect: password credential goes in the password field", "[connection]") {
    Harness h;
    auto cfg = base_config();
    cfg.credential.kind = CredentialKind::Password;
    cfg.credential.value = "pw";
    h.start(cfg);

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));
    auto auths = h.gw.sent_of_type("auth");
    REQUIRE(auths.at(0)["password"] == "pw");
    REQUIRE_FALSE(auths.at(0).contains("token"));
}

TEST_CASE("GatewayConnection::connect: no-op while an attempt is active", "[connection]") {
    Harness h;
    h.start(base_config());
    h.conn->connect();
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));
    h.conn->connect();

    REQUIRE(h.rec.count(ConnectionState::Connecting) == 1);
    REQUIRE(h.gw.created() == 1);
}

TEST_CASE("GatewayConnection: auth ack features and protocol are exposed", "[connection]") {
    Harness h;
    h.gw.auth_reply = R"({"type":"auth_ok","protocol":3,"features":["abort","thinking"]})";
    h.start(base_config());

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));
    auto snap = h.conn->snapshot();
    REQUIRE(snap.protocol == 3);
    REQUIRE(snap.supports("abort"));
    REQUIRE(snap.supports("thinking"));
    REQUIRE_FALSE(snap.supports("attachments"));
}

TEST_CASE("GatewayConnection: ack without protocol assumes the highest supported", "[connection]") {
    Harness h;
    h.gw.auth_reply = R"({"type":"auth_ok"})";
    h.start(base_config());

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));
    REQUIRE(h.conn->snapshot().protocol == kProtocolVersion);
}

TEST_CASE("GatewayConnection: protocol mismatch fails without retry", "[connection]") {
    Harness h;
    h.gw.auth_reply = R"({"type":"auth_ok","protocol":9})";
    h.start(base_config());

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Failed));
    REQUIRE(h.conn->snapshot().last_error.find("protocol mismatch") != std::string::npos);
    REQUIRE(h.sched.pending() == 0);
    REQUIRE(h.rec.count(ConnectionState::Connected) == 0);
}

TEST_CASE("GatewayConnection: silent gateway times out during auth", "[connection]") {
    Harness h;
    h.gw.auth_reply = "";
    auto cfg = base_config();
    cfg.tuning.auth_timeout_ms = 100;
    h.start(cfg);

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    REQUIRE(h.conn->snapshot().last_error == "timed out waiting for auth ack");
    REQUIRE(h.rec.count(ConnectionState::Connected) == 0);
}

// ── Auth rejection ───────────────────────────────────────────────

TEST_CASE("GatewayConnection: repeated auth rejection ends in Failed", "[connection]") {
    Harness h;
    h.gw.auth_reply = R"({"type":"auth_error","message":"bad token"})";
    auto cfg = base_config();
    cfg.tuning.max_auth_failures = 3;
    h.start(cfg);

    h.conn->connect();
    for (size_t n = 1; n <= 2; ++n) {
        REQUIRE(wait_for([&] {
            return h.rec.rejected().size() == n &&
                   h.conn->state() == ConnectionState::Reconnecting;
        }));
        REQUIRE(h.conn->snapshot().auth_failures == n);
        h.sched.advance(milliseconds(h.sched.next_due_in()));
    }
    REQUIRE(h.wait_state(ConnectionState::Failed));

    auto rejected = h.rec.rejected();
    REQUIRE(rejected.size() == 3);
    REQUIRE(rejected[0].reason == "bad token");
    REQUIRE(rejected[0].consecutive == 1);
    REQUIRE_FALSE(rejected[0].final);
    REQUIRE_FALSE(rejected[1].final);
    REQUIRE(rejected[2].consecutive == 3);
    REQUIRE(rejected[2].final);

    REQUIRE(h.conn->snapshot().last_error == "auth rejected: bad token");
    REQUIRE(h.sched.pending() == 0);
}

TEST_CASE("GatewayConnection: connect after Failed starts a fresh count", "[connection]") {
    Harness h;
    h.gw.auth_reply = R"({"type":"auth_error"})";
    auto cfg = base_config();
    cfg.tuning.max_auth_failures = 1;
    h.start(cfg);

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Failed));
    REQUIRE(h.rec.rejected().at(0).final);
    REQUIRE(h.rec.rejected().at(0).reason == "authentication rejected");

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.rec.rejected().size() == 2; }));
    REQUIRE(h.wait_state(ConnectionState::Failed));
    REQUIRE(h.rec.rejected().at(1).consecutive == 1);
}

// ── Reconnect and backoff ────────────────────────────────────────

TEST_CASE("GatewayConnection: failed dial retries with growing delays", "[connection]") {
    Harness h;
    h.gw.fail_opens = 2;
    h.start(base_config());

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.rec.count(ConnectionState::Reconnecting) == 1; }));
    REQUIRE(h.conn->snapshot().last_error.find("connection refused") != std::string::npos);
    REQUIRE(h.sched.next_due_in() == 1000);

    h.sched.advance(milliseconds(999));
    REQUIRE(h.conn->state() == ConnectionState::Reconnecting);
    h.sched.advance(milliseconds(1));
    REQUIRE(wait_for([&] { return h.rec.count(ConnectionState::Reconnecting) == 2; }));
    REQUIRE(h.sched.next_due_in() == 2000);
    REQUIRE(h.conn->snapshot().reconnect_attempt == 2);

    h.sched.advance(milliseconds(2000));
    REQUIRE(h.wait_state(ConnectionState::Connected));
    REQUIRE(h.gw.opens() == 1);
}

TEST_CASE("GatewayConnection: stable connection resets the backoff", "[connection]") {
    Harness h;
    h.gw.fail_opens = 1;
    h.start(base_config());

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    h.sched.advance(milliseconds(h.sched.next_due_in()));
    REQUIRE(h.wait_state(ConnectionState::Connected));
    REQUIRE(h.conn->snapshot().reconnect_attempt == 1);

    h.sched.advance(milliseconds(29999));
    REQUIRE(h.conn->snapshot().reconnect_attempt == 1);
    h.sched.advance(milliseconds(1));
    REQUIRE(h.conn->snapshot().reconnect_attempt == 0);
}

TEST_CASE("GatewayConnection::disconnect: cancels a pending retry", "[connection]") {
    Harness h;
    h.gw.fail_opens = 5;
    h.start(base_config());

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    REQUIRE(h.sched.pending() == 1);

    h.conn->disconnect();
    REQUIRE(h.conn->state() == ConnectionState::Disconnected);
    REQUIRE(h.sched.pending() == 0);

    h.sched.advance(milliseconds(120000));
    REQUIRE(h.conn->state() == ConnectionState::Disconnected);
    REQUIRE(h.gw.created() == 1);
}

TEST_CASE("GatewayConnection: peer close triggers a reconnect", "[connection]") {
    Harness h;
    h.start(base_config());
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    h.gw.drop();
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    REQUIRE(h.conn->snapshot().last_error == "connection closed by gateway");

    h.sched.advance(milliseconds(h.sched.next_due_in()));
    REQUIRE(h.wait_state(ConnectionState::Connected));
    REQUIRE(h.gw.opens() == 2);
    REQUIRE(h.gw.sent_of_type("auth").size() == 2);
}

TEST_CASE("GatewayConnection: shutdown notice delays the retry", "[connection]") {
    Harness h;
    h.start(base_config());
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    h.gw.push(R"({"type":"shutdown","reason":"upgrade","restartExpectedMs":5000})");
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    REQUIRE(h.conn->snapshot().last_error == "gateway shutting down: upgrade");
    REQUIRE(h.sched.next_due_in() == 5000);

    auto events = h.gw.events();
    REQUIRE(std::count(events.begin(), events.end(), "transport.close") == 1);
}

// ── Heartbeat ────────────────────────────────────────────────────

TEST_CASE("GatewayConnection: missing pongs close the connection", "[connection]") {
    Harness h;
    auto cfg = base_config();
    cfg.tuning.heartbeat_interval_ms = 1000;
    cfg.tuning.missed_pong_limit = 2;
    cfg.tuning.stability_window_ms = 600000;
    h.start(cfg);
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    h.sched.advance(milliseconds(1000));
    h.sched.advance(milliseconds(1000));
    REQUIRE(h.gw.sent_of_type("ping").size() == 2);
    REQUIRE(h.conn->state() == ConnectionState::Connected);

    h.sched.advance(milliseconds(1000));
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    REQUIRE(h.conn->snapshot().last_error == "heartbeat timeout");
    REQUIRE(h.gw.sent_of_type("ping").size() == 2);
}

TEST_CASE("GatewayConnection: answered pings keep the connection", "[connection]") {
    Harness h;
    h.gw.auto_pong = true;
    auto cfg = base_config();
    cfg.tuning.heartbeat_interval_ms = 1000;
    cfg.tuning.missed_pong_limit = 2;
    cfg.tuning.stability_window_ms = 600000;
    h.start(cfg);
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    for (int i = 0; i < 5; ++i) {
        h.sched.advance(milliseconds(1000));
        REQUIRE(wait_for([&] { return h.gw.inbound_empty(); }));
    }
    REQUIRE(h.gw.sent_of_type("ping").size() == 5);
    REQUIRE(h.conn->state() == ConnectionState::Connected);
}

TEST_CASE("GatewayConnection: answers gateway pings", "[connection]") {
    Harness h;
    h.start(base_config());
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    h.gw.push(R"({"type":"ping"})");
    REQUIRE(wait_for([&] { return h.gw.sent_of_type("pong").size() == 1; }));
}

// ── Outbound queue ───────────────────────────────────────────────

TEST_CASE("GatewayConnection::enqueue: held while offline, sent in order after auth", "[connection]") {
    Harness h;
    h.start(base_config());
    h.conn->enqueue("s1", codec::encode_message("s1", "one"));
    h.conn->enqueue("s2", codec::encode_message("s2", "two"));
    h.conn->enqueue("s1", codec::encode_message("s1", "three"));
    REQUIRE(h.conn->snapshot().queued == 3);
    REQUIRE(h.gw.created() == 0);

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.gw.sent_of_type("message").size() == 3; }));

    auto sent = h.gw.sent();
    REQUIRE(nlohmann::json::parse(sent.at(0))["type"] == "auth");
    auto msgs = h.gw.sent_of_type("message");
    REQUIRE(msgs[0]["text"] == "one");
    REQUIRE(msgs[1]["text"] == "two");
    REQUIRE(msgs[2]["text"] == "three");
    REQUIRE(wait_for([&] { return h.conn->snapshot().queued == 0; }));
}

TEST_CASE("GatewayConnection::enqueue: sends on the next flush while connected", "[connection]") {
    Harness h;
    h.start(base_config());
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    h.conn->enqueue("s1", codec::encode_message("s1", "live"));
    h.sched.run_due();
    auto msgs = h.gw.sent_of_type("message");
    REQUIRE(msgs.size() == 1);
    REQUIRE(msgs[0]["channel"] == "s1");
    REQUIRE(h.conn->snapshot().queued == 0);
}

TEST_CASE("GatewayConnection::enqueue: overflow drops the oldest entry", "[connection]") {
    Harness h;
    auto cfg = base_config();
    cfg.tuning.queue_capacity = 2;
    h.start(cfg);

    h.conn->enqueue("first", codec::encode_message("first", "a"));
    h.conn->enqueue("second", codec::encode_message("second", "b"));
    REQUIRE(h.rec.overflows.empty());
    h.conn->enqueue("third", codec::encode_message("third", "c"));

    REQUIRE(h.rec.overflows == std::vector<std::string>{"first"});
    REQUIRE(h.conn->snapshot().queued == 2);

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.gw.sent_of_type("message").size() == 2; }));
    auto msgs = h.gw.sent_of_type("message");
    REQUIRE(msgs[0]["text"] == "b");
    REQUIRE(msgs[1]["text"] == "c");
}

TEST_CASE("GatewayConnection: failed send keeps the entry for the next session", "[connection]") {
    Harness h;
    h.start(base_config());
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    h.gw.fail_sends = true;
    h.conn->enqueue("s1", codec::encode_message("s1", "retry me"));
    h.sched.run_due();
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    REQUIRE(h.conn->snapshot().last_error == "send failed");
    REQUIRE(h.conn->snapshot().queued == 1);

    h.gw.fail_sends = false;
    h.sched.advance(milliseconds(h.sched.next_due_in()));
    REQUIRE(wait_for([&] { return h.gw.sent_of_type("message").size() == 1; }));
    REQUIRE(h.gw.sent_of_type("message")[0]["text"] == "retry me");
}

TEST_CASE("GatewayConnection::disconnect: keeps queued entries", "[connection]") {
    Harness h;
    h.gw.fail_opens = 1;
    h.start(base_config());
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));

    h.conn->enqueue("s1", codec::encode_message("s1", "x"));
    h.conn->enqueue("s1", codec::encode_message("s1", "y"));
    h.conn->disconnect();
    REQUIRE(h.conn->snapshot().queued == 2);

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.gw.sent_of_type("message").size() == 2; }));
}

// ── Inbound routing ──────────────────────────────────────────────

TEST_CASE("GatewayConnection: streamed reply reaches the owning session", "[connection]") {
    Harness h;
    h.start(base_config());
    SessionRegistry reg(*h.conn);
    reg.set_event_bus(&h.bus);
    reg.subscribe_events();

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    auto s = reg.create("main");
    REQUIRE(reg.append_outbound(s.id, "hi"));
    h.sched.run_due();
    auto msgs = h.gw.sent_of_type("message");
    REQUIRE(msgs.size() == 1);
    REQUIRE(msgs[0]["channel"] == s.id);
    REQUIRE(msgs[0]["text"] == "hi");

    nlohmann::json d1 = {{"type", "delta"}, {"channel", s.id}, {"kind", "content"},
                         {"text", "Hel"}, {"seq", 1}};
    nlohmann::json d2 = {{"type", "delta"}, {"channel", s.id}, {"kind", "content"},
                         {"text", "lo"}, {"seq", 2}};
    nlohmann::json end = {{"type", "end"}, {"channel", s.id}, {"seq", 3}};
    h.gw.push(d1.dump());
    h.gw.push("{not json");
    h.gw.push(R"({"type":"presence","who":"someone"})");
    h.gw.push(d2.dump());
    h.gw.push(end.dump());

    REQUIRE(wait_for([&] { return h.rec.completed_messages().size() == 1; }));
    REQUIRE(h.rec.completed_messages()[0].content == "Hello");
    REQUIRE(h.conn->state() == ConnectionState::Connected);

    auto history = reg.messages(s.id);
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].role == Role::User);
    REQUIRE(history[1].content == "Hello");
    REQUIRE(history[1].complete);
}

TEST_CASE("GatewayConnection: history reply seeds a restored session", "[connection]") {
    auto dir = make_temp_dir();
    const std::string id = "agent:main:desk_1_1";
    {
        std::ofstream f(dir + "/current.json");
        f << nlohmann::json{{"current_session", id}, {"bot_id", "main"}}.dump();
    }

    Harness h;
    h.start(base_config());
    SessionRegistry reg(*h.conn, dir);
    reg.set_event_bus(&h.bus);
    reg.subscribe_events();
    REQUIRE(reg.restore_current() == id);
    REQUIRE(h.conn->snapshot().queued == 1);

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.gw.sent_of_type("history").size() == 1; }));
    auto request = h.gw.sent_of_type("history")[0];
    REQUIRE(request["channel"] == id);
    REQUIRE(request["limit"] == 20);

    nlohmann::json part = {{"type", "text"}, {"text", "nothing"}};
    nlohmann::json reply = {{"type", "history"}, {"channel", id}, {"messages", nlohmann::json::array({
        {{"role", "user"}, {"content", "what changed?"}},
        {{"role", "assistant"}, {"content", nlohmann::json::array({part})}}
    })}};
    h.gw.push(reply.dump());

    REQUIRE(wait_for([&] { return reg.messages(id).size() == 2; }));
    auto msgs = reg.messages(id);
    REQUIRE(msgs[0].role == Role::User);
    REQUIRE(msgs[0].content == "what changed?");
    REQUIRE(msgs[1].content == "nothing");

    h.conn.reset();
    std::filesystem::remove_all(dir);
}

// ── Credentials ──────────────────────────────────────────────────

TEST_CASE("GatewayConnection: encrypted credential is revealed for auth only", "[connection]") {
    auto dir = make_temp_dir();
    SecretStore store(key_file_path(dir));
    auto cfg = base_config();
    cfg.credential.value = store.seal("s3cret");
    REQUIRE(SecretStore::is_encrypted(cfg.credential.value));

    Harness h;
    h.start(cfg, &store);
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    REQUIRE(h.gw.sent_of_type("auth").at(0)["token"] == "s3cret");
    for (const auto& frame : h.gw.sent())
        REQUIRE(frame.find("enc:") == std::string::npos);

    h.conn.reset();
    std::filesystem::remove_all(dir);
}

TEST_CASE("GatewayConnection: unreadable credential fails before dialling", "[connection]") {
    auto dir = make_temp_dir();
    auto other = make_temp_dir();
    SecretStore store(key_file_path(dir));
    SecretStore missing(key_file_path(other));
    auto cfg = base_config();
    cfg.credential.value = store.seal("s3cret");

    SECTION("key file missing") {
        Harness h;
        h.start(cfg, &missing);
        h.conn->connect();
        REQUIRE(h.wait_state(ConnectionState::Failed));
        REQUIRE(h.conn->snapshot().last_error.rfind("credential unavailable", 0) == 0);
        REQUIRE(h.gw.created() == 0);
    }

    SECTION("no key store at all") {
        Harness h;
        h.start(cfg);
        h.conn->connect();
        REQUIRE(h.wait_state(ConnectionState::Failed));
        REQUIRE(h.gw.created() == 0);
    }

    std::filesystem::remove_all(dir);
    std::filesystem::remove_all(other);
}

TEST_CASE("GatewayConnection::disconnect: returns while the dial is in progress", "[connection]") {
    Harness h;
    h.gw.hold_opens = true;
    h.start(base_config());

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.gw.dialing() == 1; }));

    auto start = std::chrono::steady_clock::now();
    h.conn->disconnect();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
    REQUIRE(h.conn->state() == ConnectionState::Disconnected);
    REQUIRE(wait_for([&] { return h.gw.dialing() == 0; }));

    h.sched.advance(milliseconds(120000));
    h.conn.reset();
    REQUIRE(h.rec.history() == std::vector<ConnectionState>{
        ConnectionState::Connecting, ConnectionState::Disconnected});
    REQUIRE(h.gw.opens() == 0);
    REQUIRE(h.sched.pending() == 0);
}

TEST_CASE("GatewayConnection::disconnect: during auth, no later transition", "[connection]") {
    Harness h;
    h.gw.auth_reply = "";
    auto cfg = base_config();
    cfg.tuning.auth_timeout_ms = 60000;
    h.start(cfg);

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Authenticating));

    auto start = std::chrono::steady_clock::now();
    h.conn->disconnect();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));

    h.sched.advance(milliseconds(120000));
    h.conn.reset();
    REQUIRE(h.rec.history() == std::vector<ConnectionState>{
        ConnectionState::Connecting, ConnectionState::Authenticating,
        ConnectionState::Disconnected});
    REQUIRE(h.gw.events() == std::vector<std::string>{"transport.open", "transport.close"});
    REQUIRE(h.sched.pending() == 0);
}

TEST_CASE("GatewayConnection: state events arrive in transition order", "[connection]") {
    std::mutex seen_mutex;
    std::vector<ConnectionState> seen;
    std::atomic<bool> holding{false};
    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool gate_open = false;

    Harness h;
    h.gw.fail_opens = 1;
    h.start(base_config());

    // Delivery of the retry's Connecting stalls until the gate opens
    subscribe<ConnectionStateChangedEvent>(h.bus, [&](const ConnectionStateChangedEvent& ev) {
        if (ev.current == ConnectionState::Connecting && ev.reason.rfind("retry", 0) == 0) {
            holding = true;
            std::unique_lock<std::mutex> lock(gate_mutex);
            gate_cv.wait(lock, [&] { return gate_open; });
        }
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(ev.current);
    });

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.rec.count(ConnectionState::Reconnecting) == 1; }));

    auto due = milliseconds(h.sched.next_due_in());
    std::thread timer([&] { h.sched.advance(due); });
    bool held = wait_for([&] { return holding.load(); });

    std::thread stopper([&] { h.conn->disconnect(); });
    bool stopped = wait_for([&] { return h.conn->state() == ConnectionState::Disconnected; });
    std::this_thread::sleep_for(milliseconds(50));

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        gate_open = true;
    }
    gate_cv.notify_all();
    timer.join();
    stopper.join();

    REQUIRE(held);
    REQUIRE(stopped);
    std::lock_guard<std::mutex> lock(seen_mutex);
    REQUIRE(seen.size() == 4);
    REQUIRE(seen[2] == ConnectionState::Connecting);
    REQUIRE(seen.back() == ConnectionState::Disconnected);
    REQUIRE(h.conn->state() == ConnectionState::Disconnected);
}

TEST_CASE("ConnectionStateChangedEvent: sequence grows with every transition", "[connection]") {
    std::vector<uint64_t> sequences;
    std::mutex mutex;
    Harness h;
    subscribe<ConnectionStateChangedEvent>(h.bus, [&](const ConnectionStateChangedEvent& ev) {
        std::lock_guard<std::mutex> lock(mutex);
        sequences.push_back(ev.sequence);
    });
    h.start(base_config());

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));
    h.conn->disconnect();

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(sequences == std::vector<uint64_t>{1, 2, 3, 4});
}

// ── SSH tunnel ───────────────────────────────────────────────────

static ConnectionConfig tunnel_config() {
    auto cfg = base_config();
    cfg.endpoint_url = "wss://gw.example.com:18789/ws?client=desk";
    TunnelConfig tc;
    tc.ssh_user = "deploy";
    tc.ssh_host = "bastion.example.com";
    tc.local_port = 18789;
    tc.remote_port = 18789;
    cfg.tunnel = tc;
    return cfg;
}

TEST_CASE("GatewayConnection: tunnel opens before and closes after the socket", "[connection][tunnel]") {
    Harness h;
    h.start(tunnel_config(), nullptr, true);
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    REQUIRE(h.gw.opened_urls() == std::vector<std::string>{"wss://127.0.0.1:18789/ws?client=desk"});
    REQUIRE(h.conn->snapshot().endpoint == "wss://127.0.0.1:18789/ws?client=desk");
    REQUIRE(h.tunnels->is_open());

    h.conn->disconnect();
    REQUIRE_FALSE(h.tunnels->is_open());
    REQUIRE(h.gw.events() == std::vector<std::string>{
        "tunnel.open", "transport.open", "transport.close", "tunnel.close"});
}

TEST_CASE("GatewayConnection: tunnel SSH password is revealed for the opener", "[connection][tunnel]") {
    auto dir = make_temp_dir();
    SecretStore store(key_file_path(dir));
    auto cfg = tunnel_config();
    cfg.tunnel->ssh_password = store.seal("hunter2");

    Harness h;
    h.start(cfg, &store, true);
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));
    REQUIRE(h.tunnel_opener.configs().at(0).ssh_password == "hunter2");

    h.conn.reset();
    std::filesystem::remove_all(dir);
}

TEST_CASE("GatewayConnection: tunnel auth failure is terminal", "[connection][tunnel]") {
    Harness h;
    h.tunnel_opener.fail_with = TunnelErrorKind::AuthFailure;
    h.start(tunnel_config(), nullptr, true);

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Failed));
    REQUIRE(h.conn->snapshot().last_error.find("tunnel") == 0);
    REQUIRE(h.gw.created() == 0);
    REQUIRE(h.sched.pending() == 0);
}

TEST_CASE("GatewayConnection: tunnel network failure is retried", "[connection][tunnel]") {
    Harness h;
    h.tunnel_opener.fail_with = TunnelErrorKind::NetworkFailure;
    h.start(tunnel_config(), nullptr, true);

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    REQUIRE(h.gw.created() == 0);

    h.tunnel_opener.fail_with.reset();
    h.sched.advance(milliseconds(h.sched.next_due_in()));
    REQUIRE(h.wait_state(ConnectionState::Connected));
    REQUIRE(h.tunnel_opener.calls() == 2);
}

TEST_CASE("GatewayConnection: lost connection tears down the tunnel too", "[connection][tunnel]") {
    Harness h;
    h.start(tunnel_config(), nullptr, true);
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    h.gw.drop();
    REQUIRE(h.wait_state(ConnectionState::Reconnecting));
    REQUIRE_FALSE(h.tunnels->is_open());

    h.sched.advance(milliseconds(h.sched.next_due_in()));
    REQUIRE(h.wait_state(ConnectionState::Connected));
    REQUIRE(h.gw.events() == std::vector<std::string>{
        "tunnel.open", "transport.open", "transport.close", "tunnel.close",
        "tunnel.open", "transport.open"});
}

TEST_CASE("GatewayConnection::disconnect: abandons a tunnel still being opened", "[connection][tunnel]") {
    Harness h;
    h.tunnel_opener.hold = true;
    h.start(tunnel_config(), nullptr, true);

    h.conn->connect();
    REQUIRE(wait_for([&] { return h.tunnel_opener.entered() == 1; }));

    auto start = std::chrono::steady_clock::now();
    h.conn->disconnect();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
    REQUIRE(h.conn->state() == ConnectionState::Disconnected);
    REQUIRE(wait_for([&] { return h.tunnel_opener.returned() == 1; }));

    h.sched.advance(milliseconds(120000));
    h.conn.reset();
    REQUIRE(h.rec.history() == std::vector<ConnectionState>{
        ConnectionState::Connecting, ConnectionState::Disconnected});
    REQUIRE(h.gw.created() == 0);
    REQUIRE_FALSE(h.tunnels->is_open());
    REQUIRE(h.gw.events().empty());
}

TEST_CASE("GatewayConnection::disconnect: connected tunnel is closed exactly once", "[connection][tunnel]") {
    Harness h;
    h.start(tunnel_config(), nullptr, true);
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));

    h.conn->disconnect();
    h.conn.reset();

    auto events = h.gw.events();
    REQUIRE(std::count(events.begin(), events.end(), "tunnel.open") == 1);
    REQUIRE(std::count(events.begin(), events.end(), "tunnel.close") == 1);
    REQUIRE(h.rec.history().back() == ConnectionState::Disconnected);
}

TEST_CASE("GatewayConnection: reconnect after disconnect gets a fresh tunnel", "[connection][tunnel]") {
    Harness h;
    h.start(tunnel_config(), nullptr, true);
    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));
    h.conn->disconnect();

    h.conn->connect();
    REQUIRE(h.wait_state(ConnectionState::Connected));
    REQUIRE(h.tunnels->is_open());
    // the superseded attempt must not tear down the new forward
    std::this_thread::sleep_for(milliseconds(50));
    REQUIRE(h.tunnels->is_open());
    REQUIRE(h.conn->state() == ConnectionState::Connected);
}
