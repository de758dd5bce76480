#include "event_bus.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace clawlink {

SubscriptionId EventBus::subscribe(const std::string& tag, EventHandler handler) {
    auto slot = std::make_shared<Slot>();
    slot->tag = tag;
    slot->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(mutex_);
    slot->id = next_id_++;
    slots_.push_back(std::move(slot));
    return slots_.back()->id;
}

bool EventBus::busy_elsewhere(const Slot& slot) const {
    auto self = std::this_thread::get_id();
    return std::any_of(slot.delivering.begin(), slot.delivering.end(),
                       [&](const std::thread::id& t) { return t != self; });
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [&](const std::shared_ptr<Slot>& s) { return s->id == id; });
    if (it == slots_.end()) return false;

    std::shared_ptr<Slot> slot = *it;
    slot->removed = true;
    slots_.erase(it);
    idle_.wait(lock, [&] { return !busy_elsewhere(*slot); });
    return true;
}

void EventBus::publish(const Event& event) {
    const auto self = std::this_thread::get_id();

    std::vector<std::shared_ptr<Slot>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& slot : slots_) {
            if (slot->tag != event.type_tag) continue;
            slot->delivering.push_back(self);
            targets.push_back(slot);
        }
    }

    for (const auto& slot : targets) {
        bool live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            live = !slot->removed;
        }
        if (live) {
            try {
                slot->handler(event);
            } catch (const std::exception& e) {
                std::cerr << "[events] Handler for " << event.type_tag
                          << " threw: " << e.what() << "\n";
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& d = slot->delivering;
            auto pos = std::find(d.begin(), d.end(), self);
            if (pos != d.end()) d.erase(pos);
        }
        idle_.notify_all();
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) slot->removed = true;
    slots_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(
        slots_.begin(), slots_.end(),
        [&](const std::shared_ptr<Slot>& s) { return s->tag == tag; }));
}

} // namespace clawlink
