#pragma once
#include "codec.hpp"
#include "message.hpp"
#include "stream_assembler.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clawlink {

class EventBus;
class OutboundSink;
class ScopedSubscriptions;

struct Session {
    std::string id;        // also the wire channel
    std::string bot_id;
    uint64_t created_at = 0;
    std::mutex mutex;      // guards assembler and the history flags
    StreamAssembler assembler;
    bool history_requested = false;
    bool history_loaded = false;   // nothing more to fetch from the Gateway
};

struct SessionInfo {
    std::string id;
    std::string bot_id;
    uint64_t created_at = 0;
    size_t message_count = 0;
    bool active = false;
};

// Session id: agent:<bot_id>:desk_<epoch-ms>_<counter>
std::string make_session_id(const std::string& bot_id);

class SessionRegistry {
public:
    // state_dir holds current.json; empty disables persistence.
    explicit SessionRegistry(OutboundSink& sink, std::string state_dir = "");
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Optional event bus for session and message events
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    // Route FrameReceivedEvent from the connection into route_inbound()
    void subscribe_events();

    // New session; becomes active only if none is, and is then announced
    // and persisted the same way select() does it.
    SessionInfo create(const std::string& bot_id);

    // Make a session the displayed one and persist the pointer. The first
    // selection of a session this process did not create asks the Gateway
    // for its recent history.
    bool select(const std::string& id);

    // Later fragments for this channel are dropped; the Gateway is asked to
    // delete the session too.
    bool remove(const std::string& id);

    // Record the user turn and hand a message frame to the connection.
    bool append_outbound(const std::string& session_id, const std::string& text);

    // Ask the Gateway to stop the reply streaming into this session.
    bool abort(const std::string& session_id);

    // Apply a delta/end/error/history frame. Returns false if the frame was
    // dropped. History is applied once per session.
    bool route_inbound(const InboundFrame& frame);

    // Recreate and select the session named in current.json, if any.
    std::optional<std::string> restore_current();

    std::optional<SessionInfo> get(const std::string& id) const;
    std::vector<Message> messages(const std::string& id) const;
    std::vector<SessionInfo> list() const;
    std::optional<std::string> active_id() const;

    std::string current_file() const;

private:
    std::shared_ptr<Session> find(const std::string& id) const;
    std::shared_ptr<Session> insert(const std::string& id, const std::string& bot_id,
                                    bool& created, bool& activated);
    SessionInfo info_of(const Session& session) const;
    void announce_selected(const std::string& id, const std::string& bot_id);
    void request_history(Session& session);
    bool apply_history(const InboundFrame& frame);
    void persist_current(const std::string& id, const std::string& bot_id) const;
    void clear_current() const;

    OutboundSink& sink_;
    std::string state_dir_;
    EventBus* event_bus_ = nullptr;
    std::unique_ptr<ScopedSubscriptions> subscriptions_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::optional<std::string> active_;
};

} // namespace clawlink
