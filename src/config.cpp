#include "config.hpp"
#include "secret_store.hpp"
#include "transport.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <openssl/crypto.h>

namespace clawlink {

const char* const kSensitiveKeys[3] = {"gateway_token", "gateway_password", "ssh_password"};

nlohmann::json GatewayConfig::defaults_json() {
    ConnectionTuning t;
    return {
        {"gateway_ws_url", kDefaultGatewayUrl},
        {"gateway_token", ""},
        {"gateway_password", ""},
        {"auto_login", false},
        {"ssh_enabled", false},
        {"ssh_username", ""},
        {"ssh_server", ""},
        {"ssh_password", ""},
        {"bot_id", "main"},
        {"connection", {
            {"connect_timeout_ms", t.connect_timeout_ms},
            {"auth_timeout_ms", t.auth_timeout_ms},
            {"heartbeat_interval_ms", t.heartbeat_interval_ms},
            {"missed_pong_limit", t.missed_pong_limit},
            {"backoff_initial_ms", t.backoff.initial_ms},
            {"backoff_max_ms", t.backoff.max_ms},
            {"backoff_multiplier", t.backoff.multiplier},
            {"backoff_jitter", t.backoff.jitter},
            {"stability_window_ms", t.stability_window_ms},
            {"max_auth_failures", t.max_auth_failures},
            {"queue_capacity", t.queue_capacity},
            {"min_protocol", t.min_protocol},
            {"max_protocol", t.max_protocol}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string())
        out = j[key].get<std::string>();
}

static void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean())
        out = j[key].get<bool>();
}

// Values that do not fit T keep the default.
template <typename T>
static void read_unsigned(const nlohmann::json& j, const char* key, T& out,
                          std::vector<std::string>& warnings) {
    if (!j.contains(key) || !j[key].is_number_unsigned()) return;
    uint64_t v = j[key].get<uint64_t>();
    if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        warnings.push_back(std::string("connection.") + key + " is out of range, using default");
        return;
    }
    out = static_cast<T>(v);
}

static void read_double(const nlohmann::json& j, const char* key, double& out) {
    if (j.contains(key) && j[key].is_number())
        out = j[key].get<double>();
}

static void parse_tuning(const nlohmann::json& c, ConnectionTuning& t,
                         std::vector<std::string>& warnings) {
    read_unsigned(c, "connect_timeout_ms", t.connect_timeout_ms, warnings);
    read_unsigned(c, "auth_timeout_ms", t.auth_timeout_ms, warnings);
    read_unsigned(c, "heartbeat_interval_ms", t.heartbeat_interval_ms, warnings);
    read_unsigned(c, "missed_pong_limit", t.missed_pong_limit, warnings);
    read_unsigned(c, "backoff_initial_ms", t.backoff.initial_ms, warnings);
    read_unsigned(c, "backoff_max_ms", t.backoff.max_ms, warnings);
    read_double(c, "backoff_multiplier", t.backoff.multiplier);
    read_double(c, "backoff_jitter", t.backoff.jitter);
    read_unsigned(c, "stability_window_ms", t.stability_window_ms, warnings);
    read_unsigned(c, "max_auth_failures", t.max_auth_failures, warnings);
    read_unsigned(c, "queue_capacity", t.queue_capacity, warnings);
    read_unsigned(c, "min_protocol", t.min_protocol, warnings);
    read_unsigned(c, "max_protocol", t.max_protocol, warnings);

    ConnectionTuning d;
    // Zero would make the timer fire back to back
    struct { const char* key; long* value; long fallback; } timings[] = {
        {"connect_timeout_ms", &t.connect_timeout_ms, d.connect_timeout_ms},
        {"auth_timeout_ms", &t.auth_timeout_ms, d.auth_timeout_ms},
        {"heartbeat_interval_ms", &t.heartbeat_interval_ms, d.heartbeat_interval_ms},
    };
    for (auto& timing : timings) {
        if (*timing.value <= 0) {
            warnings.push_back(std::string("connection.") + timing.key + " is 0, using default");
            *timing.value = timing.fallback;
        }
    }
    if (t.backoff.initial_ms == 0) {
        warnings.push_back("connection.backoff_initial_ms is 0, using default");
        t.backoff.initial_ms = d.backoff.initial_ms;
    }
    if (t.backoff.multiplier < 1.0) {
        warnings.push_back("connection.backoff_multiplier below 1.0, using default");
        t.backoff.multiplier = d.backoff.multiplier;
    }
    if (t.backoff.jitter < 0.0 || t.backoff.jitter >= 1.0) {
        warnings.push_back("connection.backoff_jitter outside [0, 1), using default");
        t.backoff.jitter = d.backoff.jitter;
    }
    if (t.backoff.max_ms < t.backoff.initial_ms) t.backoff.max_ms = t.backoff.initial_ms;
    if (t.queue_capacity == 0) {
        warnings.push_back("connection.queue_capacity is 0, using default");
        t.queue_capacity = d.queue_capacity;
    }
    if (t.max_auth_failures == 0) t.max_auth_failures = 1;
    if (t.min_protocol > t.max_protocol) {
        warnings.push_back("connection.min_protocol exceeds max_protocol, using defaults");
        t.min_protocol = d.min_protocol;
        t.max_protocol = d.max_protocol;
    }
}

// Record once per load whether the stored secrets are actually usable.
static void check_secrets(GatewayConfig& cfg) {
    const std::string* values[3] = {&cfg.gateway_token, &cfg.gateway_password, &cfg.ssh_password};

    bool any_marked = false;
    for (const auto* v : values)
        if (SecretStore::is_encrypted(*v)) any_marked = true;

    if (any_marked) {
        SecretStore store(cfg.key_path());
        if (!store.key_exists()) {
            cfg.warnings.push_back("encrypted credentials present but key file "
                                   + cfg.key_path() + " is missing; they cannot be used");
            return;
        }
        for (size_t i = 0; i < 3; i++) {
            if (!SecretStore::is_encrypted(*values[i])) continue;
            try {
                std::string plain = store.decrypt(*values[i]);
                OPENSSL_cleanse(&plain[0], plain.size());
            } catch (const SecretError& e) {
                cfg.warnings.push_back(std::string(kSensitiveKeys[i]) +
                                       " cannot be decrypted: " + e.what());
            }
        }
    }

    for (size_t i = 0; i < 3; i++) {
        const std::string key = kSensitiveKeys[i];
        bool from_env = std::find(cfg.env_keys.begin(), cfg.env_keys.end(), key)
                        != cfg.env_keys.end();
        if (!values[i]->empty() && !SecretStore::is_encrypted(*values[i]) && !from_env)
            cfg.warnings.push_back(key + " is stored unencrypted");
    }
}

std::string GatewayConfig::default_path() {
    return expand_home("~/.clawlink/gateway.json");
}

std::string GatewayConfig::config_dir() const {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return ".";
    return path.substr(0, slash);
}

std::string GatewayConfig::key_path() const {
    return key_file_path(config_dir());
}

GatewayConfig GatewayConfig::load() {
    return load(default_path());
}

GatewayConfig GatewayConfig::load(const std::string& config_path) {
    GatewayConfig cfg;
    cfg.path = config_path;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        nlohmann::json original;
        std::string parse_error;
        try {
            original = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            parse_error = e.what();
        }
        file.close();
        if (parse_error.empty() && !original.is_object())
            parse_error = "root is not an object";

        if (parse_error.empty()) {
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n", true))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } else {
            // Left on disk untouched so the user can repair it
            std::cerr << "[config] Malformed " << config_path << " (" << parse_error
                      << "), using defaults\n";
            cfg.warnings.push_back("config file is malformed, using defaults");
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n", true))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    read_string(j, "gateway_ws_url", cfg.gateway_ws_url);
    read_string(j, "gateway_token", cfg.gateway_token);
    read_string(j, "gateway_password", cfg.gateway_password);
    read_bool(j, "auto_login", cfg.auto_login);
    read_bool(j, "ssh_enabled", cfg.ssh_enabled);
    read_string(j, "ssh_username", cfg.ssh_username);
    read_string(j, "ssh_server", cfg.ssh_server);
    read_string(j, "ssh_password", cfg.ssh_password);
    read_string(j, "bot_id", cfg.bot_id);
    if (cfg.bot_id.empty()) cfg.bot_id = "main";

    if (j.contains("connection") && j["connection"].is_object())
        parse_tuning(j["connection"], cfg.connection, cfg.warnings);

    // Environment variables always override config file
    if (const char* v = std::getenv("CLAWLINK_GATEWAY_URL")) {
        cfg.gateway_ws_url = v;
        cfg.env_keys.push_back("gateway_ws_url");
    }
    if (const char* v = std::getenv("CLAWLINK_GATEWAY_TOKEN")) {
        cfg.gateway_token = v;
        cfg.env_keys.push_back("gateway_token");
    }
    if (const char* v = std::getenv("CLAWLINK_GATEWAY_PASSWORD")) {
        cfg.gateway_password = v;
        cfg.env_keys.push_back("gateway_password");
    }

    ParsedUrl parsed;
    std::string error;
    if (!parse_ws_url(cfg.gateway_ws_url, parsed, error))
        cfg.warnings.push_back("gateway_ws_url is invalid: " + error);

    if (cfg.ssh_enabled) {
        std::string host;
        uint16_t port = 0;
        if (cfg.ssh_username.empty() || !parse_ssh_server(cfg.ssh_server, host, port))
            cfg.warnings.push_back("ssh_enabled but ssh_username/ssh_server are incomplete; "
                                   "connecting without a tunnel");
    }

    check_secrets(cfg);
    for (const auto& w : cfg.warnings)
        std::cerr << "[config] Warning: " << w << "\n";

    return cfg;
}

bool GatewayConfig::persist(SecretStore& secrets) {
    std::string* values[3] = {&gateway_token, &gateway_password, &ssh_password};
    bool from_env[3] = {false, false, false};
    for (size_t i = 0; i < 3; i++)
        from_env[i] = std::find(env_keys.begin(), env_keys.end(), kSensitiveKeys[i])
                      != env_keys.end();

    std::string sealed[3];
    try {
        for (size_t i = 0; i < 3; i++) {
            if (from_env[i]) continue;
            sealed[i] = SecretStore::is_encrypted(*values[i]) ? *values[i]
                                                              : secrets.seal(*values[i]);
        }
    } catch (const SecretError& e) {
        std::cerr << "[config] Cannot seal credentials: " << e.what() << "\n";
        return false;
    }

    bool url_from_env = std::find(env_keys.begin(), env_keys.end(), "gateway_ws_url")
                        != env_keys.end();

    bool ok = modify_config_json(path, [&](nlohmann::json& j) {
        if (!url_from_env) j["gateway_ws_url"] = gateway_ws_url;
        for (size_t i = 0; i < 3; i++)
            if (!from_env[i]) j[kSensitiveKeys[i]] = sealed[i];
        j["auto_login"] = auto_login;
        j["ssh_enabled"] = ssh_enabled;
        j["ssh_username"] = ssh_username;
        j["ssh_server"] = ssh_server;
        j["bot_id"] = bot_id;
        auto& c = j["connection"];
        c["connect_timeout_ms"] = connection.connect_timeout_ms;
        c["auth_timeout_ms"] = connection.auth_timeout_ms;
        c["heartbeat_interval_ms"] = connection.heartbeat_interval_ms;
        c["missed_pong_limit"] = connection.missed_pong_limit;
        c["backoff_initial_ms"] = connection.backoff.initial_ms;
        c["backoff_max_ms"] = connection.backoff.max_ms;
        c["backoff_multiplier"] = connection.backoff.multiplier;
        c["backoff_jitter"] = connection.backoff.jitter;
        c["stability_window_ms"] = connection.stability_window_ms;
        c["max_auth_failures"] = connection.max_auth_failures;
        c["queue_capacity"] = connection.queue_capacity;
        c["min_protocol"] = connection.min_protocol;
        c["max_protocol"] = connection.max_protocol;
    });
    if (!ok) return false;

    for (size_t i = 0; i < 3; i++)
        if (!from_env[i]) *values[i] = sealed[i];
    return true;
}

ConnectionConfig GatewayConfig::to_connection_config() const {
    ConnectionConfig cc;
    cc.endpoint_url = gateway_ws_url;
    cc.auto_connect = auto_login;
    cc.tuning = connection;
    if (!gateway_token.empty()) {
        cc.credential = {CredentialKind::Token, gateway_token};
    } else if (!gateway_password.empty()) {
        cc.credential = {CredentialKind::Password, gateway_password};
    }

    if (ssh_enabled && !ssh_username.empty()) {
        TunnelConfig tc;
        ParsedUrl url;
        std::string error;
        if (parse_ssh_server(ssh_server, tc.ssh_host, tc.ssh_port) &&
            parse_ws_url(gateway_ws_url, url, error)) {
            // Forward the Gateway's own port: local N -> server's 127.0.0.1:N
            auto port = static_cast<uint16_t>(std::stoul(url.port));
            tc.ssh_user = ssh_username;
            tc.ssh_password = ssh_password;
            tc.local_port = port;
            tc.remote_host = "127.0.0.1";
            tc.remote_port = port;
            cc.tunnel = tc;
        }
    }
    return cc;
}

bool modify_config_json(const std::string& path,
                        const std::function<void(nlohmann::json&)>& modifier) {
    nlohmann::json j = nlohmann::json::object();
    std::string content;
    if (read_file(path, content)) {
        auto parsed = nlohmann::json::parse(content, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) j = std::move(parsed);
    }
    modifier(j);
    if (!atomic_write_file(path, j.dump(4) + "\n", true)) {
        std::cerr << "[config] Failed to write " << path << "\n";
        return false;
    }
    return true;
}

} // namespace clawlink
