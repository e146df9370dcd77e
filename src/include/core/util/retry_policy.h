#pragma once

#include <chrono>
#include <core/util/config.h>
#include <cstdint>

namespace reup::core {

// Decides whether another connection attempt is made after a transport fault, and how
// long to wait before it. max_attempts == 0 means retry without limit.
class RetryPolicy {
public:
    RetryPolicy() = default;
    RetryPolicy(std::uint32_t max_attempts,
                std::chrono::milliseconds initial_delay,
                RetryBackoff backoff = RetryBackoff::kFixed,
                std::chrono::milliseconds max_delay = transfer::kDefaultMaxRetryDelay);

    static RetryPolicy FromSettings(const Settings& settings);
    static RetryPolicy Fixed(std::uint32_t max_attempts, std::chrono::milliseconds delay);

    bool ShouldRetry(std::uint32_t attempts_made) const;

    // Delay before attempt `attempts_made + 1`, attempts_made >= 1
    std::chrono::milliseconds DelayFor(std::uint32_t attempts_made) const;

    std::uint32_t max_attempts() const { return max_attempts_; }
    bool unlimited() const { return max_attempts_ == 0; }

private:
    std::uint32_t max_attempts_ = transfer::kDefaultMaxRetries;
    std::chrono::milliseconds initial_delay_ = transfer::kDefaultRetryDelay;
    RetryBackoff backoff_ = RetryBackoff::kFixed;
    std::chrono::milliseconds max_delay_ = transfer::kDefaultMaxRetryDelay;
};

} // namespace reup::core
