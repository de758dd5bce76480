#pragma once
#include "gateway_connection.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace clawlink {

class SecretStore;

// Keys whose values are stored "enc:"-marked
extern const char* const kSensitiveKeys[3];

struct GatewayConfig {
    std::string gateway_ws_url = kDefaultGatewayUrl;
    std::string gateway_token;      // persisted form: "enc:..." or legacy plaintext
    std::string gateway_password;   // persisted form
    bool auto_login = false;

    bool ssh_enabled = false;
    std::string ssh_username;
    std::string ssh_server;         // "host" or "host:port"
    std::string ssh_password;       // persisted form; empty = agent/key auth

    std::string bot_id = "main";
    ConnectionTuning connection;

    std::string path;                       // file this was loaded from
    std::vector<std::string> env_keys;      // keys taken from the environment
    std::vector<std::string> warnings;      // degraded-security and validation notes

    // ~/.clawlink/gateway.json
    static std::string default_path();

    // Load from default_path() + env vars
    static GatewayConfig load();

    // Missing file: defaults are written. Malformed file: defaults are used
    // and the file is left alone. Missing keys are filled in and saved.
    static GatewayConfig load(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    std::string config_dir() const;
    std::string key_path() const;

    // Write every key back, sealing unmarked sensitive values first.
    // Values that came from the environment are not written.
    bool persist(SecretStore& secrets);

    // Connection settings for the next attempt. Credentials stay sealed.
    ConnectionConfig to_connection_config() const;
};

// Read-modify-write a config file atomically.
// The callback receives a mutable reference to the parsed JSON.
bool modify_config_json(const std::string& path,
                        const std::function<void(nlohmann::json&)>& modifier);

} // namespace clawlink
