#include "codec.hpp"
#include <nlohmann/json.hpp>

namespace clawlink {
namespace codec {

using json = nlohmann::json;

std::string encode_auth(const AuthParams& params) {
    json j = {
        {"type", "auth"},
        {"minProtocol", params.min_protocol},
        {"maxProtocol", params.max_protocol},
        {"client", {
            {"id", params.client_id},
            {"version", params.client_version},
            {"platform", params.platform}
        }}
    };
    // Token wins when both are configured
    if (!params.token.empty()) {
        j["token"] = params.token;
    } else if (!params.password.empty()) {
        j["password"] = params.password;
    }
    return j.dump();
}

std::string encode_message(const std::string& channel, const std::string& text) {
    json j = {{"type", "message"}, {"channel", channel}, {"text", text}};
    return j.dump();
}

std::string encode_abort(const std::string& channel) {
    json j = {{"type", "abort"}, {"channel", channel}};
    return j.dump();
}

std::string encode_history(const std::string& channel, uint32_t limit) {
    if (limit < 1) limit = 1;
    if (limit > kMaxHistoryLimit) limit = kMaxHistoryLimit;
    json j = {{"type", "history"}, {"channel", channel}, {"limit", limit}};
    return j.dump();
}

std::string encode_session_delete(const std::string& channel) {
    json j = {{"type", "session_delete"}, {"channel", channel}};
    return j.dump();
}

std::string encode_ping() {
    return R"({"type":"ping"})";
}

std::string encode_pong() {
    return R"({"type":"pong"})";
}

static bool require_channel(const json& j, InboundFrame& f, std::string& error) {
    if (!j.contains("channel") || !j["channel"].is_string() ||
        j["channel"].get<std::string>().empty()) {
        error = "frame '" + f.raw_type + "' missing channel";
        return false;
    }
    f.channel = j["channel"].get<std::string>();
    return true;
}

static bool require_seq(const json& j, InboundFrame& f, std::string& error) {
    if (!j.contains("seq") || !j["seq"].is_number_integer()) {
        error = "frame '" + f.raw_type + "' missing integer seq";
        return false;
    }
    f.seq = j["seq"].get<int64_t>();
    return true;
}

// "content" is either a string or an array of {"text": ...} parts.
static std::string history_text(const json& m) {
    const char* keys[] = {"content", "text"};
    for (const char* key : keys) {
        if (!m.contains(key)) continue;
        const json& v = m[key];
        if (v.is_string()) return v.get<std::string>();
        if (v.is_array()) {
            std::string out;
            for (const auto& part : v) {
                if (part.is_object() && part.contains("text") && part["text"].is_string())
                    out += part["text"].get<std::string>();
            }
            return out;
        }
    }
    return "";
}

// Entries with other roles or no text are skipped.
static void read_history(const json& j, InboundFrame& f) {
    if (!j.contains("messages") || !j["messages"].is_array()) return;
    for (const auto& m : j["messages"]) {
        if (!m.is_object() || !m.contains("role") || !m["role"].is_string()) continue;
        std::string role = m["role"].get<std::string>();
        HistoryEntry entry;
        if (role == "user") {
            entry.role = Role::User;
        } else if (role == "assistant") {
            entry.role = Role::Assistant;
        } else {
            continue;
        }
        entry.text = history_text(m);
        if (entry.text.empty()) continue;
        f.history.push_back(std::move(entry));
    }
}

DecodeResult decode(const std::string& data) {
    DecodeResult result;

    json j = json::parse(data, nullptr, false);
    if (j.is_discarded()) {
        result.error = "invalid JSON";
        return result;
    }
    if (!j.is_object()) {
        result.error = "frame is not an object";
        return result;
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        result.error = "frame has no type";
        return result;
    }

    InboundFrame f;
    f.raw_type = j["type"].get<std::string>();
    const std::string& type = f.raw_type;

    if (type == "auth_ok") {
        f.type = FrameType::AuthOk;
        if (j.contains("protocol") && j["protocol"].is_number_unsigned())
            f.protocol = j["protocol"].get<uint32_t>();
        if (j.contains("features") && j["features"].is_array()) {
            for (const auto& m : j["features"]) {
                if (m.is_string()) f.features.push_back(m.get<std::string>());
            }
        }
    } else if (type == "auth_error") {
        f.type = FrameType::AuthError;
        if (j.contains("message") && j["message"].is_string())
            f.text = j["message"].get<std::string>();
    } else if (type == "delta") {
        f.type = FrameType::Delta;
        if (!require_channel(j, f, result.error)) return result;
        if (!require_seq(j, f, result.error)) return result;
        std::string kind;
        if (j.contains("kind") && j["kind"].is_string())
            kind = j["kind"].get<std::string>();
        if (kind == "content") {
            f.kind = FragmentKind::Content;
        } else if (kind == "thinking") {
            f.kind = FragmentKind::Thinking;
        } else {
            result.error = "delta has unknown kind '" + kind + "'";
            return result;
        }
        if (!j.contains("text") || !j["text"].is_string()) {
            result.error = "delta missing text";
            return result;
        }
        f.text = j["text"].get<std::string>();
    } else if (type == "end") {
        f.type = FrameType::End;
        f.kind = FragmentKind::End;
        if (!require_channel(j, f, result.error)) return result;
        if (!require_seq(j, f, result.error)) return result;
    } else if (type == "error") {
        f.type = FrameType::Error;
        f.kind = FragmentKind::Error;
        if (!require_channel(j, f, result.error)) return result;
        if (!require_seq(j, f, result.error)) return result;
        if (j.contains("message") && j["message"].is_string())
            f.text = j["message"].get<std::string>();
    } else if (type == "history") {
        f.type = FrameType::History;
        if (!require_channel(j, f, result.error)) return result;
        read_history(j, f);
    } else if (type == "ping") {
        f.type = FrameType::Ping;
    } else if (type == "pong") {
        f.type = FrameType::Pong;
    } else if (type == "shutdown") {
        f.type = FrameType::Shutdown;
        if (j.contains("reason") && j["reason"].is_string())
            f.text = j["reason"].get<std::string>();
        if (j.contains("restartExpectedMs") && j["restartExpectedMs"].is_number_unsigned())
            f.restart_expected_ms = j["restartExpectedMs"].get<uint64_t>();
    } else {
        f.type = FrameType::Unknown;
    }

    result.frame = std::move(f);
    return result;
}

const char* frame_type_name(FrameType type) {
    switch (type) {
        case FrameType::AuthOk:    return "auth_ok";
        case FrameType::AuthError: return "auth_error";
        case FrameType::Delta:     return "delta";
        case FrameType::End:       return "end";
        case FrameType::Error:     return "error";
        case FrameType::Ping:      return "ping";
        case FrameType::Pong:      return "pong";
        case FrameType::Shutdown:  return "shutdown";
        case FrameType::History:   return "history";
        case FrameType::Unknown:   return "unknown";
    }
    return "unknown";
}

} // namespace codec
} // namespace clawlink
