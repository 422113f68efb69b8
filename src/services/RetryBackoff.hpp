#pragma once

#include "config/Settings.hpp"

#include <chrono>
#include <cstdint>
#include <random>

namespace cre::services {

// Exponential backoff with jitter and no attempt limit. Delays grow from
// backoff_initial_ms by backoff_multiplier up to backoff_max_ms.
class RetryBackoff {
public:
    explicit RetryBackoff(const cre::config::ReplicationSettings& settings);

    std::chrono::milliseconds next_delay();
    void reset() noexcept;

    uint32_t attempts() const noexcept { return attempts_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    double multiplier_;
    double jitter_;
    double current_ms_;
    uint32_t attempts_{0};
    std::mt19937 rng_;
};

} // namespace cre::services
