#pragma once

#include "config/Settings.hpp"
#include "infrastructure/EventCodec.hpp"
#include "repositories/ISnapshotStore.hpp"
#include "services/IStateProvider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace cre::services {

enum class SnapshotOutcome {
    Written,
    Skipped,   // nothing new since the last snapshot, or the store already has a newer one
    Failed,
};

std::string to_string(SnapshotOutcome outcome);

// Persists the provider's current state on a wall-clock interval and/or
// after a number of applied events, whichever comes first. Runs on its own
// thread and only ever reads the published state.
class SnapshotScheduler {
public:
    SnapshotScheduler(const IStateProvider& provider,
                      cre::repositories::ISnapshotStore& store,
                      std::string partition_key,
                      cre::config::SnapshotSettings settings);
    ~SnapshotScheduler();

    SnapshotScheduler(const SnapshotScheduler&) = delete;
    SnapshotScheduler& operator=(const SnapshotScheduler&) = delete;

    void start();
    void stop();

    // Take a snapshot now, on the calling thread.
    SnapshotOutcome snapshot_now();

    int64_t last_written_sequence() const;
    uint64_t snapshots_written() const noexcept { return written_; }
    uint64_t failures() const noexcept { return failures_; }

private:
    void run();
    bool due() const;

    const IStateProvider& provider_;
    cre::repositories::ISnapshotStore& store_;
    std::string partition_key_;
    cre::config::SnapshotSettings settings_;
    cre::infrastructure::EventCodec codec_;

    mutable std::mutex write_mutex_;
    int64_t last_written_sequence_{-1};
    uint64_t events_at_last_trigger_{0};
    std::chrono::steady_clock::time_point last_trigger_;

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> failures_{0};

    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    bool stop_requested_{false};
};

} // namespace cre::services
