#pragma once
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace clawlink {

// Ordered record of open/close calls across fakes and threads.
class EventLog {
public:
    void add(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

// Scripted Gateway shared by every FakeTransport a factory hands out.
// Only the most recently opened transport receives pushed frames.
class FakeGateway {
public:
    // Frame pushed back whenever an auth frame is sent; empty = stay silent.
    // Set before connect().
    std::string auth_reply = R"({"type":"auth_ok","protocol":3})";

    std::atomic<bool> auto_pong{false};
    std::atomic<int> fail_opens{0};      // the next N opens fail
    std::atomic<bool> fail_sends{false};
    std::atomic<bool> hold_opens{false}; // opens wait until the transport is closed

    // Shared with tunnel fakes to check open/close ordering
    std::shared_ptr<EventLog> log = std::make_shared<EventLog>();

    void push(const std::string& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push_back(frame);
        cv_.notify_all();
    }

    // Peer closes the current connection
    void drop() {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped_epoch_ = epoch_;
        cv_.notify_all();
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    // Sent frames of one wire type, in order
    std::vector<nlohmann::json> sent_of_type(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (const auto& s : sent()) {
            auto j = nlohmann::json::parse(s, nullptr, false);
            if (!j.is_discarded() && j.value("type", "") == type) out.push_back(j);
        }
        return out;
    }

    std::vector<std::string> opened_urls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_urls_;
    }

    int opens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(opened_urls_.size());
    }

    int created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }

    // Opens currently held by hold_opens
    int dialing() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dialing_;
    }

    bool inbound_empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inbound_.empty();
    }

    std::vector<std::string> events() const { return log->entries(); }

    TransportFactory factory();

private:
    friend class FakeTransport;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    std::vector<std::string> sent_;
    std::vector<std::string> opened_urls_;
    uint64_t epoch_ = 0;
    uint64_t dropped_epoch_ = 0;
    int created_ = 0;
    int dialing_ = 0;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(FakeGateway& gw) : gw_(gw) {}

    bool open(const std::string& url, long, std::string& error) override {
        std::unique_lock<std::mutex> lock(gw_.mutex_);
        if (gw_.hold_opens) {
            ++gw_.dialing_;
            gw_.cv_.wait(lock, [this] { return closed_; });
            --gw_.dialing_;
            error = "connection aborted";
            return false;
        }
        if (gw_.fail_opens > 0) {
            gw_.fail_opens--;
            error = "connection refused";
            return false;
        }
        epoch_ = ++gw_.epoch_;
        gw_.inbound_.clear();
        gw_.opened_urls_.push_back(url);
        gw_.log->add("transport.open");
        return true;
    }

    bool send_text(const std::string& data) override {
        std::lock_guard<std::mutex> lock(gw_.mutex_);
        if (closed_ || gw_.fail_sends) return false;
        gw_.sent_.push_back(data);

        auto j = nlohmann::json::parse(data, nullptr, false);
        std::string type = j.is_discarded() ? "" : j.value("type", "");
        if (type == "auth" && !gw_.auth_reply.empty()) {
            gw_.inbound_.push_back(gw_.auth_reply);
            gw_.cv_.notify_all();
        } else if (type == "ping" && gw_.auto_pong) {
            gw_.inbound_.push_back(R"({"type":"pong"})");
            gw_.cv_.notify_all();
        }
        return true;
    }

    ReadStatus receive(std::string& out, long timeout_ms) override {
        std::unique_lock<std::mutex> lock(gw_.mutex_);
        auto ready = [this] {
            return closed_ || gw_.dropped_epoch_ == epoch_ ||
                   (epoch_ == gw_.epoch_ && !gw_.inbound_.empty());
        };
        if (!gw_.cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready))
            return ReadStatus::Timeout;
        if (closed_ || gw_.dropped_epoch_ == epoch_) return ReadStatus::Closed;
        out = gw_.inbound_.front();
        gw_.inbound_.pop_front();
        return ReadStatus::Message;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(gw_.mutex_);
        if (closed_) return;
        closed_ = true;
        if (epoch_ != 0) gw_.log->add("transport.close");
        gw_.cv_.notify_all();
    }

private:
    FakeGateway& gw_;
    uint64_t epoch_ = 0;
    bool closed_ = false;
};

inline TransportFactory FakeGateway::factory() {
    return [this]() -> std::unique_ptr<Transport> {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            created_++;
        }
        return std::make_unique<FakeTransport>(*this);
    };
}

} // namespace clawlink
