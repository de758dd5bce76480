#pragma once
#include <chrono>
#include <cstdint>
#include <random>

namespace clawlink {

struct BackoffPolicy {
    uint32_t initial_ms = 3000;
    uint32_t max_ms = 60000;
    double multiplier = 2.0;
    double jitter = 0.2;   // delay is scaled by a factor in [1 - jitter, 1 + jitter]
};

// Exponential backoff with jitter, capped at max_ms.
// attempt 0 -> initial, attempt n -> initial * multiplier^n.
class Backoff {
public:
    explicit Backoff(BackoffPolicy policy = {}, uint32_t seed = std::random_device{}());

    // Delay for the current attempt; advances the attempt counter.
    std::chrono::milliseconds next_delay();

    void reset() { attempt_ = 0; }
    uint32_t attempt() const { return attempt_; }
    const BackoffPolicy& policy() const { return policy_; }

private:
    BackoffPolicy policy_;
    uint32_t attempt_ = 0;
    std::mt19937 rng_;
};

} // namespace clawlink
