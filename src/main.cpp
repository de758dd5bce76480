#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "gateway_connection.hpp"
#include "scheduler.hpp"
#include "secret_store.hpp"
#include "session_registry.hpp"
#include "transport.hpp"
#include "tunnel.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <csignal>
#include <mutex>
#include <unordered_map>

static void print_usage() {
    std::cout << "Usage: clawlink [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.clawlink/gateway.json)\n"
              << "  --url URL            Gateway WebSocket URL for this run\n"
              << "  --encrypt VALUE      Print VALUE encrypted with the local key and exit\n"
              << "  --save-token TOKEN   Store an encrypted gateway token and exit\n"
              << "  --save-password PW   Store an encrypted gateway password and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /new [BOT]           Create a session (default bot from config)\n"
              << "  /sessions            List sessions\n"
              << "  /select ID           Switch the active session\n"
              << "  /delete ID           Delete a session\n"
              << "  /abort               Stop the reply streaming into the active session\n"
              << "  /status              Show connection state\n"
              << "  /connect             Connect to the Gateway\n"
              << "  /disconnect          Close the connection\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  CLAWLINK_GATEWAY_URL       Gateway URL\n"
              << "  CLAWLINK_GATEWAY_TOKEN     Gateway token\n"
              << "  CLAWLINK_GATEWAY_PASSWORD  Gateway password\n";
}

static void print_status(const clawlink::ConnectionSnapshot& snap) {
    std::cout << "State: " << clawlink::connection_state_name(snap.state) << "\n";
    if (!snap.endpoint.empty())
        std::cout << "Endpoint: " << snap.endpoint << "\n";
    if (snap.protocol)
        std::cout << "Protocol: " << snap.protocol << "\n";
    std::cout << "Queued: " << snap.queued << "\n";
    if (snap.reconnect_attempt)
        std::cout << "Reconnect attempt: " << snap.reconnect_attempt << "\n";
    if (snap.auth_failures)
        std::cout << "Auth failures: " << snap.auth_failures << "\n";
    if (!snap.last_error.empty())
        std::cout << "Last error: " << snap.last_error << "\n";
}

// Store one sealed credential in the config file.
static int save_credential(clawlink::GatewayConfig& config, bool token, const std::string& value) {
    clawlink::SecretStore secrets(config.key_path());
    if (token) config.gateway_token = value;
    else config.gateway_password = value;
    if (!config.persist(secrets)) return 1;
    std::cout << (token ? "Token" : "Password") << " saved to " << config.path << "\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string url;
    std::string to_encrypt;
    std::string save_token;
    std::string save_password;
    bool encrypt = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            url = argv[++i];
        } else if (std::strcmp(argv[i], "--encrypt") == 0 && i + 1 < argc) {
            to_encrypt = argv[++i];
            encrypt = true;
        } else if (std::strcmp(argv[i], "--save-token") == 0 && i + 1 < argc) {
            save_token = argv[++i];
        } else if (std::strcmp(argv[i], "--save-password") == 0 && i + 1 < argc) {
            save_password = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // SSL_write on a peer-closed socket would otherwise kill the process
    std::signal(SIGPIPE, SIG_IGN);

    auto config = config_path.empty() ? clawlink::GatewayConfig::load()
                                      : clawlink::GatewayConfig::load(config_path);

    if (encrypt) {
        clawlink::SecretStore secrets(config.key_path());
        try {
            std::cout << secrets.encrypt(to_encrypt) << "\n";
        } catch (const clawlink::SecretError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }
    if (!save_token.empty()) return save_credential(config, true, save_token);
    if (!save_password.empty()) return save_credential(config, false, save_password);

    if (!url.empty()) config.gateway_ws_url = url;

    clawlink::EventBus bus;
    clawlink::ThreadScheduler scheduler;
    clawlink::SecretStore secrets(config.key_path());
    clawlink::TunnelManager tunnels;
    clawlink::GatewayConnection connection(
        config.to_connection_config(),
        [] { return std::make_unique<clawlink::WebSocketTransport>(); },
        scheduler, bus, &secrets, &tunnels);

    clawlink::SessionRegistry sessions(connection, config.config_dir());
    sessions.set_event_bus(&bus);

    // Reply streaming: print only what is new since the last update
    std::mutex out_mutex;
    std::unordered_map<std::string, size_t> printed;
    auto stream_key = [](const std::string& session_id, const clawlink::Message& m) {
        return session_id + "#" + std::to_string(m.sequence_index);
    };

    // Declared after everything the handlers capture, so it unsubscribes first
    clawlink::ScopedSubscriptions subscriptions(bus);

    subscriptions.add(clawlink::subscribe<clawlink::SessionMessageUpdatedEvent>(bus,
        [&](const clawlink::SessionMessageUpdatedEvent& ev) {
            if (sessions.active_id() != ev.session_id) return;
            std::lock_guard<std::mutex> lock(out_mutex);
            size_t& done = printed[stream_key(ev.session_id, ev.message)];
            if (ev.message.content.size() > done) {
                std::cout << ev.message.content.substr(done) << std::flush;
                done = ev.message.content.size();
            }
        }));

    subscriptions.add(clawlink::subscribe<clawlink::SessionMessageCompletedEvent>(bus,
        [&](const clawlink::SessionMessageCompletedEvent& ev) {
            std::lock_guard<std::mutex> lock(out_mutex);
            auto key = stream_key(ev.session_id, ev.message);
            if (sessions.active_id() == ev.session_id) {
                size_t done = printed[key];
                if (ev.message.content.size() > done)
                    std::cout << ev.message.content.substr(done);
                if (!ev.message.error.empty())
                    std::cout << "\n[error] " << ev.message.error;
                std::cout << "\n" << std::flush;
            }
            printed.erase(key);
        }));

    subscriptions.add(clawlink::subscribe<clawlink::SessionHistoryLoadedEvent>(bus,
        [&](const clawlink::SessionHistoryLoadedEvent& ev) {
            if (sessions.active_id() != ev.session_id || ev.count == 0) return;
            auto messages = sessions.messages(ev.session_id);
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << "* earlier in this session:\n";
            for (size_t i = 0; i < ev.count && i < messages.size(); ++i) {
                std::cout << clawlink::role_name(messages[i].role) << ": "
                          << messages[i].content << "\n";
            }
            std::cout << std::flush;
        }));

    subscriptions.add(clawlink::subscribe<clawlink::ConnectionStateChangedEvent>(bus,
        [&](const clawlink::ConnectionStateChangedEvent& ev) {
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << "* " << clawlink::connection_state_name(ev.current);
            if (!ev.reason.empty()) std::cout << " (" << ev.reason << ")";
            std::cout << "\n" << std::flush;
        }));

    subscriptions.add(clawlink::subscribe<clawlink::AuthRejectedEvent>(bus,
        [&](const clawlink::AuthRejectedEvent& ev) {
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << "* authentication rejected";
            if (!ev.reason.empty()) std::cout << ": " << ev.reason;
            if (ev.final) std::cout << " (check the gateway credentials, then /connect)";
            std::cout << "\n" << std::flush;
        }));

    subscriptions.add(clawlink::subscribe<clawlink::QueueOverflowEvent>(bus,
        [&](const clawlink::QueueOverflowEvent& ev) {
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << "* outbound queue full, dropped a message for "
                      << ev.session_id << "\n" << std::flush;
        }));

    sessions.subscribe_events();
    sessions.restore_current();

    std::cout << "clawlink Gateway bridge\n"
              << "Gateway: " << config.gateway_ws_url
              << (config.ssh_enabled ? " (via SSH tunnel)" : "") << "\n"
              << "Type /help for commands, /quit to exit.\n\n";
    for (const auto& w : config.warnings)
        std::cout << "Warning: " << w << "\n";

    if (config.auto_login) connection.connect();

    std::string line;
    while (true) {
        std::cout << "clawlink> " << std::flush;

        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        line = clawlink::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            auto space = line.find(' ');
            std::string cmd = line.substr(0, space);
            std::string arg = space == std::string::npos ? "" : clawlink::trim(line.substr(space + 1));

            if (cmd == "/quit" || cmd == "/exit") {
                break;
            } else if (cmd == "/new") {
                auto info = sessions.create(arg.empty() ? config.bot_id : arg);
                if (!info.active) sessions.select(info.id);
                std::cout << "Session " << info.id << "\n";
            } else if (cmd == "/sessions") {
                auto all = sessions.list();
                if (all.empty()) std::cout << "No sessions.\n";
                for (const auto& s : all) {
                    std::cout << (s.active ? "* " : "  ") << s.id
                              << " (" << s.message_count << " messages)\n";
                }
            } else if (cmd == "/select") {
                if (!sessions.select(arg))
                    std::cout << "Unknown session: " << arg << "\n";
            } else if (cmd == "/delete") {
                if (!sessions.remove(arg))
                    std::cout << "Unknown session: " << arg << "\n";
            } else if (cmd == "/abort") {
                auto active = sessions.active_id();
                if (!active || !sessions.abort(*active))
                    std::cout << "No active session.\n";
            } else if (cmd == "/status") {
                print_status(connection.snapshot());
                if (auto active = sessions.active_id())
                    std::cout << "Session: " << *active << "\n";
            } else if (cmd == "/connect") {
                connection.connect();
            } else if (cmd == "/disconnect") {
                connection.disconnect();
            } else if (cmd == "/help") {
                print_usage();
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        auto active = sessions.active_id();
        if (!active) {
            active = sessions.create(config.bot_id).id;
        }
        sessions.append_outbound(*active, line);
    }

    connection.disconnect();
    scheduler.stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
