#include "services/SnapshotScheduler.hpp"

#include "domain/value_objects/Timestamp.hpp"

#include <algorithm>
#include <iostream>

namespace cre::services {

std::string to_string(SnapshotOutcome outcome) {
    switch (outcome) {
        case SnapshotOutcome::Written: return "written";
        case SnapshotOutcome::Skipped: return "skipped";
        case SnapshotOutcome::Failed: return "failed";
    }
    return "unknown";
}

SnapshotScheduler::SnapshotScheduler(const IStateProvider& provider,
                                     cre::repositories::ISnapshotStore& store,
                                     std::string partition_key,
                                     cre::config::SnapshotSettings settings)
    : provider_(provider)
    , store_(store)
    , partition_key_(std::move(partition_key))
    , settings_(settings)
    , last_trigger_(std::chrono::steady_clock::now()) {}

SnapshotScheduler::~SnapshotScheduler() {
    stop();
}

void SnapshotScheduler::start() {
    if (thread_.joinable()) return;
    {
        std::lock_guard lock(wake_mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this] { run(); });
}

void SnapshotScheduler::stop() {
    if (!thread_.joinable()) return;
    {
        std::lock_guard lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    thread_.join();

    if (settings_.snapshot_on_stop) {
        snapshot_now();
    }
}

int64_t SnapshotScheduler::last_written_sequence() const {
    std::lock_guard lock(write_mutex_);
    return last_written_sequence_;
}

void SnapshotScheduler::run() {
    auto tick = std::chrono::milliseconds(std::max(1, settings_.check_interval_ms));

    std::unique_lock lock(wake_mutex_);
    while (!stop_requested_) {
        wake_.wait_for(lock, tick, [this] { return stop_requested_; });
        if (stop_requested_) break;

        lock.unlock();
        if (due()) {
            snapshot_now();
        }
        lock.lock();
    }
}

bool SnapshotScheduler::due() const {
    std::lock_guard lock(write_mutex_);

    if (settings_.interval_seconds > 0) {
        auto elapsed = std::chrono::steady_clock::now() - last_trigger_;
        if (elapsed >= std::chrono::seconds(settings_.interval_seconds)) return true;
    }
    if (settings_.event_count_threshold > 0) {
        auto applied = provider_.events_applied();
        if (applied - events_at_last_trigger_
            >= static_cast<uint64_t>(settings_.event_count_threshold)) {
            return true;
        }
    }
    return false;
}

SnapshotOutcome SnapshotScheduler::snapshot_now() {
    std::lock_guard lock(write_mutex_);

    auto applied = provider_.events_applied();
    auto state = provider_.current_state();
    auto seq = state->get_as_of_sequence_number();

    auto mark_triggered = [&] {
        last_trigger_ = std::chrono::steady_clock::now();
        events_at_last_trigger_ = applied;
    };

    if (seq < 0 || seq <= last_written_sequence_) {
        mark_triggered();
        return SnapshotOutcome::Skipped;
    }

    // Failures leave the trigger armed so the next tick retries.
    try {
        cre::repositories::Snapshot snapshot{
            partition_key_, seq, codec_.encode_state(*state), cre::domain::Timestamp::now()};

        if (!store_.store(snapshot)) {
            std::cout << "[snapshot] Store already holds #" << seq
                      << " or newer for partition '" << partition_key_ << "'" << std::endl;
            last_written_sequence_ = seq;
            mark_triggered();
            return SnapshotOutcome::Skipped;
        }
    } catch (const std::exception& e) {
        ++failures_;
        std::cerr << "[snapshot] Write of #" << seq << " failed: " << e.what() << std::endl;
        return SnapshotOutcome::Failed;
    }

    last_written_sequence_ = seq;
    ++written_;
    mark_triggered();
    std::cout << "[snapshot] Wrote #" << seq << " for partition '" << partition_key_ << "'"
              << std::endl;
    return SnapshotOutcome::Written;
}

} // namespace cre::services
