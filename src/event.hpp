#pragma once
#include "codec.hpp"
#include "connection_state.hpp"
#include "message.hpp"
#include <string>
#include <cstdint>

namespace clawlink {

// Tag-based event dispatch without RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ConnectionStateChanged  = "ConnectionStateChanged";
    constexpr const char* AuthRejected            = "AuthRejected";
    constexpr const char* QueueOverflow           = "QueueOverflow";
    constexpr const char* FrameReceived           = "FrameReceived";
    constexpr const char* SessionCreated          = "SessionCreated";
    constexpr const char* SessionSelected         = "SessionSelected";
    constexpr const char* SessionDeleted          = "SessionDeleted";
    constexpr const char* SessionHistoryLoaded    = "SessionHistoryLoaded";
    constexpr const char* SessionMessageUpdated   = "SessionMessageUpdated";
    constexpr const char* SessionMessageCompleted = "SessionMessageCompleted";
} // namespace event_tags

// ── Connection events ───────────────────────────────────────────

struct ConnectionStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::ConnectionStateChanged;
    ConnectionState previous = ConnectionState::Disconnected;
    ConnectionState current = ConnectionState::Disconnected;
    std::string reason;
    uint64_t sequence = 0;   // increases with every transition

    ConnectionStateChangedEvent() { type_tag = TAG; }
};

struct AuthRejectedEvent : Event {
    static constexpr const char* TAG = event_tags::AuthRejected;
    std::string reason;
    uint32_t consecutive = 0;
    bool final = false;   // connection moved to Failed; credential re-entry needed

    AuthRejectedEvent() { type_tag = TAG; }
};

struct QueueOverflowEvent : Event {
    static constexpr const char* TAG = event_tags::QueueOverflow;
    std::string session_id;   // owner of the dropped entry

    QueueOverflowEvent() { type_tag = TAG; }
};

// Published by the connection's reader loop for every session-bound frame
struct FrameReceivedEvent : Event {
    static constexpr const char* TAG = event_tags::FrameReceived;
    InboundFrame frame;

    FrameReceivedEvent() { type_tag = TAG; }
};

// ── Session events ──────────────────────────────────────────────

struct SessionCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionCreated;
    std::string session_id;
    std::string bot_id;

    SessionCreatedEvent() { type_tag = TAG; }
};

struct SessionSelectedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionSelected;
    std::string session_id;

    SessionSelectedEvent() { type_tag = TAG; }
};

struct SessionDeletedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionDeleted;
    std::string session_id;

    SessionDeletedEvent() { type_tag = TAG; }
};

struct SessionHistoryLoadedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionHistoryLoaded;
    std::string session_id;
    size_t count = 0;     // earlier turns now at the front of the session

    SessionHistoryLoadedEvent() { type_tag = TAG; }
};

struct SessionMessageUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionMessageUpdated;
    std::string session_id;
    Message message;

    SessionMessageUpdatedEvent() { type_tag = TAG; }
};

struct SessionMessageCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionMessageCompleted;
    std::string session_id;
    Message message;

    SessionMessageCompletedEvent() { type_tag = TAG; }
};

} // namespace clawlink
