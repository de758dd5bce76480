#include "session_registry.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "gateway_connection.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <iostream>

namespace clawlink {

namespace {

const char* kCurrentFile = "current.json";

std::string fragment_label(const InboundFrame& frame) {
    return std::string(codec::frame_type_name(frame.type)) + " seq " + std::to_string(frame.seq);
}

} // namespace

std::string make_session_id(const std::string& bot_id) {
    static std::atomic<uint64_t> counter{0};
    return "agent:" + bot_id + ":desk_" + std::to_string(epoch_millis()) + "_" +
           std::to_string(++counter);
}

SessionRegistry::SessionRegistry(OutboundSink& sink, std::string state_dir)
    : sink_(sink), state_dir_(std::move(state_dir))
{}

// Out of line so ScopedSubscriptions is complete here
SessionRegistry::~SessionRegistry() = default;

void SessionRegistry::subscribe_events() {
    if (!event_bus_) return;
    subscriptions_ = std::make_unique<ScopedSubscriptions>(*event_bus_);
    subscriptions_->add(clawlink::subscribe<FrameReceivedEvent>(*event_bus_,
        [this](const FrameReceivedEvent& ev) {
            route_inbound(ev.frame);
        }));
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::insert(const std::string& id,
                                                 const std::string& bot_id,
                                                 bool& created, bool& activated) {
    std::lock_guard<std::mutex> lock(mutex_);
    created = false;
    activated = false;
    auto it = sessions_.find(id);
    if (it != sessions_.end()) return it->second;
    auto session = std::make_shared<Session>();
    session->id = id;
    session->bot_id = bot_id;
    session->created_at = epoch_millis();
    sessions_.emplace(id, session);
    if (!active_) {
        active_ = id;
        activated = true;
    }
    created = true;
    return session;
}

SessionInfo SessionRegistry::info_of(const Session& session) const {
    SessionInfo info;
    info.id = session.id;
    info.bot_id = session.bot_id;
    info.created_at = session.created_at;
    return info;
}

// ── Lifecycle ──────────────────────────────────────────────────

SessionInfo SessionRegistry::create(const std::string& bot_id) {
    bool created = false;
    bool activated = false;
    auto session = insert(make_session_id(bot_id), bot_id, created, activated);
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->history_loaded = true; // brand new, the Gateway has nothing yet
    }

    if (event_bus_) {
        SessionCreatedEvent ev;
        ev.session_id = session->id;
        ev.bot_id = session->bot_id;
        event_bus_->publish(ev);
    }
    if (activated) announce_selected(session->id, session->bot_id);

    auto info = get(session->id);
    return info ? *info : info_of(*session);
}

bool SessionRegistry::select(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        active_ = id;
        session = it->second;
    }
    announce_selected(id, session->bot_id);
    request_history(*session);
    return true;
}

void SessionRegistry::announce_selected(const std::string& id, const std::string& bot_id) {
    persist_current(id, bot_id);

    if (event_bus_) {
        SessionSelectedEvent ev;
        ev.session_id = id;
        event_bus_->publish(ev);
    }
}

void SessionRegistry::request_history(Session& session) {
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (session.history_loaded || session.history_requested) return;
        session.history_requested = true;
    }
    sink_.enqueue(session.id, codec::encode_history(session.id));
}

bool SessionRegistry::remove(const std::string& id) {
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(id) == 0) return false;
        if (active_ && *active_ == id) {
            active_.reset();
            was_active = true;
        }
    }
    if (was_active) clear_current();
    sink_.enqueue(id, codec::encode_session_delete(id));

    if (event_bus_) {
        SessionDeletedEvent ev;
        ev.session_id = id;
        event_bus_->publish(ev);
    }
    return true;
}

std::optional<std::string> SessionRegistry::restore_current() {
    if (state_dir_.empty()) return std::nullopt;

    std::string content;
    if (!read_file(current_file(), content)) return std::nullopt;

    auto j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object() ||
        !j.contains("current_session") || !j["current_session"].is_string()) {
        std::cerr << "[sessions] Ignoring malformed " << current_file() << "\n";
        return std::nullopt;
    }

    std::string id = j["current_session"].get<std::string>();
    if (id.empty()) return std::nullopt;
    std::string bot_id = "main";
    if (j.contains("bot_id") && j["bot_id"].is_string())
        bot_id = j["bot_id"].get<std::string>();

    bool created = false;
    bool activated = false;
    insert(id, bot_id, created, activated);
    if (created && event_bus_) {
        SessionCreatedEvent ev;
        ev.session_id = id;
        ev.bot_id = bot_id;
        event_bus_->publish(ev);
    }
    select(id);
    return id;
}

// ── Traffic ────────────────────────────────────────────────────

bool SessionRegistry::append_outbound(const std::string& session_id, const std::string& text) {
    auto session = find(session_id);
    if (!session) {
        std::cerr << "[sessions] Cannot send to unknown session " << session_id << "\n";
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->assembler.append_user(text);
    }
    sink_.enqueue(session_id, codec::encode_message(session_id, text));
    return true;
}

bool SessionRegistry::abort(const std::string& session_id) {
    if (!find(session_id)) return false;
    sink_.enqueue(session_id, codec::encode_abort(session_id));
    return true;
}

bool SessionRegistry::route_inbound(const InboundFrame& frame) {
    if (frame.type == FrameType::History) return apply_history(frame);

    Fragment fragment;
    fragment.seq = frame.seq;
    switch (frame.type) {
        case FrameType::Delta:
            fragment.kind = frame.kind == FragmentKind::Thinking ? FragmentKind::Thinking
                                                                  : FragmentKind::Content;
            fragment.delta = frame.text;
            break;
        case FrameType::End:
            fragment.kind = FragmentKind::End;
            break;
        case FrameType::Error:
            fragment.kind = FragmentKind::Error;
            fragment.delta = frame.text;
            break;
        default:
            return false;
    }

    auto session = find(frame.channel);
    if (!session) {
        std::cerr << "[sessions] Dropping " << fragment_label(frame)
                  << " for unknown channel " << frame.channel << "\n";
        return false;
    }

    ApplyOutcome outcome;
    int64_t last_seq;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        last_seq = session->assembler.last_seq();
        outcome = session->assembler.apply(fragment);
    }

    if (outcome.result == ApplyResult::Duplicate) return false;
    if (outcome.result == ApplyResult::OutOfOrder) {
        std::cerr << "[sessions] Protocol warning: out-of-order " << fragment_label(frame)
                  << " after seq " << last_seq << " on " << frame.channel << ", discarded\n";
        return false;
    }
    if (outcome.gap) {
        std::cerr << "[sessions] Sequence gap on " << frame.channel << ": " << last_seq
                  << " -> " << frame.seq << "\n";
    }

    if (event_bus_ && outcome.message) {
        if (fragment.kind == FragmentKind::Content || fragment.kind == FragmentKind::Thinking) {
            SessionMessageUpdatedEvent ev;
            ev.session_id = session->id;
            ev.message = *outcome.message;
            event_bus_->publish(ev);
        }
        if (outcome.completed) {
            SessionMessageCompletedEvent ev;
            ev.session_id = session->id;
            ev.message = *outcome.message;
            event_bus_->publish(ev);
        }
    }
    return true;
}

bool SessionRegistry::apply_history(const InboundFrame& frame) {
    auto session = find(frame.channel);
    if (!session) {
        std::cerr << "[sessions] Dropping history for unknown channel " << frame.channel << "\n";
        return false;
    }

    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->history_loaded) {
            std::cerr << "[sessions] History for " << frame.channel << " already loaded\n";
            return false;
        }
        session->history_loaded = true;
        count = session->assembler.prepend_history(frame.history);
    }

    if (event_bus_) {
        SessionHistoryLoadedEvent ev;
        ev.session_id = session->id;
        ev.count = count;
        event_bus_->publish(ev);
    }
    return true;
}

// ── Queries ────────────────────────────────────────────────────

std::optional<SessionInfo> SessionRegistry::get(const std::string& id) const {
    auto session = find(id);
    if (!session) return std::nullopt;

    SessionInfo info = info_of(*session);
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        info.message_count = session->assembler.messages().size();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    info.active = active_ && *active_ == id;
    return info;
}

std::vector<Message> SessionRegistry::messages(const std::string& id) const {
    auto session = find(id);
    if (!session) return {};
    std::lock_guard<std::mutex> lock(session->mutex);
    return session->assembler.messages();
}

std::vector<SessionInfo> SessionRegistry::list() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(sessions_.size());
        for (const auto& [id, _] : sessions_) ids.push_back(id);
    }

    std::vector<SessionInfo> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto info = get(id)) out.push_back(*info);
    }
    std::sort(out.begin(), out.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
    });
    return out;
}

std::optional<std::string> SessionRegistry::active_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

// ── Persistence ────────────────────────────────────────────────

std::string SessionRegistry::current_file() const {
    if (state_dir_.empty()) return "";
    return state_dir_ + "/" + kCurrentFile;
}

void SessionRegistry::persist_current(const std::string& id, const std::string& bot_id) const {
    if (state_dir_.empty()) return;
    nlohmann::json j = {{"current_session", id}, {"bot_id", bot_id}};
    if (!atomic_write_file(current_file(), j.dump(2) + "\n"))
        std::cerr << "[sessions] Failed to write " << current_file() << "\n";
}

void SessionRegistry::clear_current() const {
    if (state_dir_.empty()) return;
    if (std::remove(current_file().c_str()) != 0 && errno != ENOENT)
        std::cerr << "[sessions] Failed to remove " << current_file() << "\n";
}

} // namespace clawlink
