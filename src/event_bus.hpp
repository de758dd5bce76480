#pragma once
#include "event.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace clawlink {

using EventHandler = std::function<void(const Event&)>;
using SubscriptionId = uint64_t;

// Synchronous tag-dispatched publish/subscribe shared by the connection,
// the session registry and the front end.
//
// Handlers run on the publishing thread, which for inbound frames is the
// connection's reader. They are called in subscription order with the bus
// lock released. A handler that throws is logged and the rest still run.
class EventBus {
public:
    SubscriptionId subscribe(const std::string& tag, EventHandler handler);

    // Returns false for an unknown id. Once this returns the handler is not
    // running on any other thread and will not be called again. A handler
    // may unsubscribe itself.
    bool unsubscribe(SubscriptionId id);

    void publish(const Event& event);

    // Drop every subscription without waiting for running handlers.
    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Slot {
        SubscriptionId id = 0;
        std::string tag;
        EventHandler handler;
        bool removed = false;
        std::vector<std::thread::id> delivering;   // one entry per active publish
    };

    bool busy_elsewhere(const Slot& slot) const;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::vector<std::shared_ptr<Slot>> slots_;
    SubscriptionId next_id_ = 1;
};

// Typed subscribe: the handler receives the concrete event.
template<typename E>
SubscriptionId subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Unsubscribes a set of IDs on destruction. Owners that subscribe with
// `this` captured keep one so the bus never calls into a dead object.
class ScopedSubscriptions {
public:
    explicit ScopedSubscriptions(EventBus& bus) : bus_(bus) {}
    ~ScopedSubscriptions() { reset(); }

    ScopedSubscriptions(const ScopedSubscriptions&) = delete;
    ScopedSubscriptions& operator=(const ScopedSubscriptions&) = delete;

    void add(SubscriptionId id) { ids_.push_back(id); }

    void reset() {
        for (SubscriptionId id : ids_) bus_.unsubscribe(id);
        ids_.clear();
    }

    size_t size() const { return ids_.size(); }

private:
    EventBus& bus_;
    std::vector<SubscriptionId> ids_;
};

} // namespace clawlink
