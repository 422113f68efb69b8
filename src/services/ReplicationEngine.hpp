#pragma once

#include "config/Settings.hpp"
#include "domain/aggregates/ConfigState.hpp"
#include "errors/ReplicationErrors.hpp"
#include "infrastructure/EventCodec.hpp"
#include "repositories/IArchiveReader.hpp"
#include "repositories/ISnapshotStore.hpp"
#include "services/ILiveLogReader.hpp"
#include "services/IStateProvider.hpp"
#include "services/RetryBackoff.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace cre::services {

enum class EnginePhase {
    Idle,
    Bootstrapping,
    ArchiveCatchUp,
    LiveStreaming,
    Stopped,
    Failed,
};

std::string to_string(EnginePhase phase);

enum class ApplyOutcome {
    Applied,
    DuplicateSkipped,
};

// Keeps one partition's ConfigState current: resumes from the latest
// snapshot, replays whatever the live log has already expired from the
// archive, then tails the live log. A single driver thread is the only
// writer of the state and the cursor; readers get the latest published
// value from current_state() without locking.
class ReplicationEngine : public IStateProvider {
public:
    ReplicationEngine(cre::repositories::ISnapshotStore& snapshots,
                      cre::repositories::IArchiveReader& archive,
                      ILiveLogReader& live_log,
                      std::string partition_key,
                      cre::config::ReplicationSettings settings = {});
    ~ReplicationEngine() override;

    ReplicationEngine(const ReplicationEngine&) = delete;
    ReplicationEngine& operator=(const ReplicationEngine&) = delete;

    // Lifecycle. start() returns once the live stream is open, rethrows the
    // error that ended startup, or returns early if stop() is called first.
    void start();
    void stop();

    // The ordered apply step. Events behind the cursor are duplicates and
    // are skipped; events ahead of it throw errors::SequenceGapError and
    // leave the state untouched. Events for another partition throw
    // errors::MalformedEventError. Only the driver thread may call this once
    // start() has been called.
    ApplyOutcome on_event(const cre::domain::ConfigEventVariant& event);

    // IStateProvider
    std::shared_ptr<const cre::domain::ConfigState> current_state() const override;
    uint64_t events_applied() const override { return events_applied_; }

    // Introspection
    const std::string& partition_key() const noexcept { return partition_key_; }
    EnginePhase phase() const noexcept { return phase_; }
    bool healthy() const noexcept { return phase_ != EnginePhase::Failed; }
    int64_t next_sequence_number() const noexcept { return next_sequence_number_; }
    uint64_t duplicates_skipped() const noexcept { return duplicates_skipped_; }
    uint64_t malformed_skipped() const noexcept { return malformed_skipped_; }
    uint64_t reconnect_count() const noexcept { return reconnects_; }
    std::string last_error() const;

private:
    void run();
    void bootstrap();
    void catch_up_from_archive();
    void stream_live();
    void on_malformed(const cre::errors::MalformedEventError& error);
    void publish(cre::domain::ConfigState state);
    void mark_live();
    void fail(std::exception_ptr error, const std::string& what);
    void wait_before_retry(const std::string& reason);

    template <typename Operation>
    auto with_retry(const std::string& what, Operation&& op);

    cre::repositories::ISnapshotStore& snapshots_;
    cre::repositories::IArchiveReader& archive_;
    ILiveLogReader& live_log_;
    std::string partition_key_;
    cre::config::ReplicationSettings settings_;
    cre::infrastructure::EventCodec codec_;
    RetryBackoff backoff_;

    std::atomic<std::shared_ptr<const cre::domain::ConfigState>> state_;
    std::atomic<int64_t> next_sequence_number_{0};
    std::atomic<EnginePhase> phase_{EnginePhase::Idle};
    std::atomic<uint64_t> events_applied_{0};
    std::atomic<uint64_t> duplicates_skipped_{0};
    std::atomic<uint64_t> malformed_skipped_{0};
    std::atomic<uint64_t> reconnects_{0};
    std::atomic<bool> stop_requested_{false};

    std::thread driver_;
    mutable std::mutex mutex_;
    std::mutex join_mutex_;
    std::condition_variable cv_;
    bool live_ready_{false};
    bool finished_{false};
    std::exception_ptr startup_error_;
    std::string last_error_;
    std::shared_ptr<ILogSubscription> subscription_;
};

} // namespace cre::services
