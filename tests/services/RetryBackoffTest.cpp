#include "services/RetryBackoff.hpp"

#include <gtest/gtest.h>

using cre::services::RetryBackoff;
using std::chrono::milliseconds;

namespace {

cre::config::ReplicationSettings backoff(int initial, int max, double multiplier, double jitter) {
    cre::config::ReplicationSettings s;
    s.backoff_initial_ms = initial;
    s.backoff_max_ms = max;
    s.backoff_multiplier = multiplier;
    s.backoff_jitter = jitter;
    return s;
}

} // namespace

TEST(RetryBackoff, GrowsExponentiallyUpToCap) {
    RetryBackoff b(backoff(100, 1000, 2.0, 0.0));

    EXPECT_EQ(b.next_delay(), milliseconds(100));
    EXPECT_EQ(b.next_delay(), milliseconds(200));
    EXPECT_EQ(b.next_delay(), milliseconds(400));
    EXPECT_EQ(b.next_delay(), milliseconds(800));
    EXPECT_EQ(b.next_delay(), milliseconds(1000));
    EXPECT_EQ(b.next_delay(), milliseconds(1000));
    EXPECT_EQ(b.attempts(), 6);
}

TEST(RetryBackoff, ResetStartsOver) {
    RetryBackoff b(backoff(100, 1000, 2.0, 0.0));
    b.next_delay();
    b.next_delay();

    b.reset();
    EXPECT_EQ(b.attempts(), 0);
    EXPECT_EQ(b.next_delay(), milliseconds(100));
}

TEST(RetryBackoff, JitterStaysWithinBounds) {
    RetryBackoff b(backoff(1000, 1000, 1.0, 0.2));

    for (int i = 0; i < 200; ++i) {
        auto delay = b.next_delay();
        EXPECT_GE(delay, milliseconds(800));
        EXPECT_LE(delay, milliseconds(1000));
    }
}

TEST(RetryBackoff, ClampsNonsenseSettings) {
    RetryBackoff b(backoff(0, -5, 0.5, 3.0));

    // initial and max clamp to 1ms, multiplier to 1, jitter to 100%
    for (int i = 0; i < 10; ++i) {
        EXPECT_LE(b.next_delay(), milliseconds(1));
    }
}

TEST(RetryBackoff, MaxBelowInitialUsesInitial) {
    RetryBackoff b(backoff(500, 100, 2.0, 0.0));
    EXPECT_EQ(b.next_delay(), milliseconds(500));
    EXPECT_EQ(b.next_delay(), milliseconds(500));
}
