#include "services/RetryBackoff.hpp"

#include <algorithm>

namespace cre::services {

RetryBackoff::RetryBackoff(const cre::config::ReplicationSettings& settings)
    : initial_(std::max(1, settings.backoff_initial_ms))
    , max_(std::max({1, settings.backoff_initial_ms, settings.backoff_max_ms}))
    , multiplier_(std::max(1.0, settings.backoff_multiplier))
    , jitter_(std::clamp(settings.backoff_jitter, 0.0, 1.0))
    , current_ms_(static_cast<double>(initial_.count()))
    , rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryBackoff::next_delay() {
    double delay = current_ms_;
    if (jitter_ > 0.0) {
        std::uniform_real_distribution<double> spread(1.0 - jitter_, 1.0 + jitter_);
        delay *= spread(rng_);
    }
    delay = std::min(delay, static_cast<double>(max_.count()));

    current_ms_ = std::min(current_ms_ * multiplier_, static_cast<double>(max_.count()));
    ++attempts_;
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

void RetryBackoff::reset() noexcept {
    current_ms_ = static_cast<double>(initial_.count());
    attempts_ = 0;
}

} // namespace cre::services
