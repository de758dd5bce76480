#pragma once
#include "message.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

#ifndef CLAWLINK_VERSION
#define CLAWLINK_VERSION "0.1.0"
#endif

namespace clawlink {

constexpr uint32_t kProtocolVersion = 3;
constexpr uint32_t kDefaultHistoryLimit = 20;
constexpr uint32_t kMaxHistoryLimit = 1000;

enum class FrameType {
    AuthOk,
    AuthError,
    Delta,
    End,
    Error,
    Ping,
    Pong,
    Shutdown,
    History,
    Unknown,   // forward-compatible: decoded but ignored
};

enum class FragmentKind { Content, Thinking, End, Error };

// One earlier turn from a "history" frame.
struct HistoryEntry {
    Role role = Role::User;
    std::string text;
};

// A decoded inbound frame. Only the fields relevant to `type` are set.
struct InboundFrame {
    FrameType type = FrameType::Unknown;
    std::string raw_type;                 // wire value of "type"
    std::string channel;
    FragmentKind kind = FragmentKind::Content;
    std::string text;                     // delta text or error/reject message
    int64_t seq = 0;
    uint32_t protocol = 0;                // auth_ok; 0 = not announced
    std::vector<std::string> features;    // auth_ok
    uint64_t restart_expected_ms = 0;     // shutdown
    std::vector<HistoryEntry> history;    // history, oldest first
};

struct DecodeResult {
    std::optional<InboundFrame> frame;
    std::string error;   // set when frame is empty
};

struct AuthParams {
    std::string token;
    std::string password;
    uint32_t min_protocol = kProtocolVersion;
    uint32_t max_protocol = kProtocolVersion;
    std::string client_id = "clawlink";
    std::string client_version = CLAWLINK_VERSION;
    std::string platform = "linux";
};

// JSON text frames, one per transport message.
namespace codec {

std::string encode_auth(const AuthParams& params);
std::string encode_message(const std::string& channel, const std::string& text);
std::string encode_abort(const std::string& channel);
// `limit` is clamped to 1..kMaxHistoryLimit.
std::string encode_history(const std::string& channel,
                           uint32_t limit = kDefaultHistoryLimit);
std::string encode_session_delete(const std::string& channel);
std::string encode_ping();
std::string encode_pong();

// Never throws. A malformed frame yields an empty result with an error;
// an unrecognised "type" yields FrameType::Unknown.
DecodeResult decode(const std::string& data);

const char* frame_type_name(FrameType type);

} // namespace codec

} // namespace clawlink
