#include <algorithm>
#include <core/util/retry_policy.h>

namespace reup::core {

RetryPolicy::RetryPolicy(std::uint32_t max_attempts,
                         std::chrono::milliseconds initial_delay,
                         RetryBackoff backoff,
                         std::chrono::milliseconds max_delay)
    : max_attempts_(max_attempts)
    , initial_delay_(initial_delay)
    , backoff_(backoff)
    , max_delay_(std::max(max_delay, initial_delay)) {}

RetryPolicy RetryPolicy::FromSettings(const Settings& settings) {
    return RetryPolicy(settings.max_retries,
                       settings.retry_delay,
                       settings.retry_backoff,
                       settings.max_retry_delay);
}

RetryPolicy RetryPolicy::Fixed(std::uint32_t max_attempts, std::chrono::milliseconds delay) {
    return RetryPolicy(max_attempts, delay, RetryBackoff::kFixed, delay);
}

bool RetryPolicy::ShouldRetry(std::uint32_t attempts_made) const {
    return max_attempts_ == 0 || attempts_made < max_attempts_;
}

std::chrono::milliseconds RetryPolicy::DelayFor(std::uint32_t attempts_made) const {
    if (backoff_ == RetryBackoff::kFixed || attempts_made <= 1) {
        return initial_delay_;
    }
    auto delay = initial_delay_;
    for (std::uint32_t i = 1; i < attempts_made && delay < max_delay_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_);
}

} // namespace reup::core
