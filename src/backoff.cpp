#include "backoff.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace clawlink {

Backoff::Backoff(BackoffPolicy policy, uint32_t seed)
    : policy_(policy), rng_(seed)
{
    if (policy_.multiplier < 1.0) policy_.multiplier = 1.0;
    policy_.jitter = std::clamp(policy_.jitter, 0.0, 1.0);
    if (policy_.max_ms < policy_.initial_ms) policy_.max_ms = policy_.initial_ms;
}

std::chrono::milliseconds Backoff::next_delay() {
    double base = static_cast<double>(policy_.initial_ms) *
                  std::pow(policy_.multiplier, static_cast<double>(attempt_));
    base = std::min(base, static_cast<double>(policy_.max_ms));

    double factor = 1.0;
    if (policy_.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - policy_.jitter,
                                                    1.0 + policy_.jitter);
        factor = dist(rng_);
    }
    double delay = std::min(base * factor, static_cast<double>(policy_.max_ms));

    if (attempt_ < UINT32_MAX) ++attempt_;

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

} // namespace clawlink
