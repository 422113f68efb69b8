#include "services/SnapshotScheduler.hpp"

#include "errors/ReplicationErrors.hpp"
#include "fakes/EventFactory.hpp"
#include "infrastructure/EventCodec.hpp"
#include "repositories/InMemorySnapshotStore.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>

using namespace cre::domain;
using namespace cre::services;
using cre::repositories::InMemorySnapshotStore;
using cre::repositories::Snapshot;
using cre::testing::counting_markups;
using cre::testing::eventually;

// --- Test fakes ---

class FakeStateProvider : public IStateProvider {
    mutable std::mutex mutex_;
    std::shared_ptr<const ConfigState> state_ =
        std::make_shared<const ConfigState>(ConfigState::empty());
    std::atomic<uint64_t> applied_{0};

public:
    std::shared_ptr<const ConfigState> current_state() const override {
        std::lock_guard lock(mutex_);
        return state_;
    }
    uint64_t events_applied() const override { return applied_; }

    // Moves the state to counting_markups(0, as_of).
    void advance_to(int64_t as_of) {
        auto state = ConfigState::replay(ConfigState::empty(), counting_markups(0, as_of));
        std::lock_guard lock(mutex_);
        state_ = std::make_shared<const ConfigState>(std::move(state));
        applied_ = static_cast<uint64_t>(as_of + 1);
    }
};

class FailingSnapshotStore : public cre::repositories::ISnapshotStore {
public:
    int failures_left = 1;
    InMemorySnapshotStore inner;

    std::optional<Snapshot> load_latest(const std::string& key) const override {
        return inner.load_latest(key);
    }
    bool store(const Snapshot& snapshot) override {
        if (failures_left > 0) {
            --failures_left;
            throw cre::errors::SnapshotWriteError("bucket unavailable");
        }
        return inner.store(snapshot);
    }
};

// --- Fixture ---

class SnapshotSchedulerTest : public ::testing::Test {
protected:
    FakeStateProvider provider;
    InMemorySnapshotStore store;
    cre::infrastructure::EventCodec codec;

    cre::config::SnapshotSettings manual() {
        cre::config::SnapshotSettings s;
        s.interval_seconds = 0;
        s.event_count_threshold = 0;
        s.check_interval_ms = 5;
        s.snapshot_on_stop = false;
        return s;
    }
};

// --- snapshot_now ---

TEST_F(SnapshotSchedulerTest, WritesCurrentState) {
    SnapshotScheduler scheduler(provider, store, "p0", manual());
    provider.advance_to(41);

    EXPECT_EQ(scheduler.snapshot_now(), SnapshotOutcome::Written);

    auto snapshot = store.load_latest("p0");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->sequence_number, 41);
    EXPECT_EQ(codec.decode_state(snapshot->payload), *provider.current_state());
    EXPECT_EQ(scheduler.last_written_sequence(), 41);
    EXPECT_EQ(scheduler.snapshots_written(), 1);
}

TEST_F(SnapshotSchedulerTest, SkipsEmptyState) {
    SnapshotScheduler scheduler(provider, store, "p0", manual());

    EXPECT_EQ(scheduler.snapshot_now(), SnapshotOutcome::Skipped);
    EXPECT_FALSE(store.has_snapshot("p0"));
}

TEST_F(SnapshotSchedulerTest, SkipsWhenNothingNew) {
    SnapshotScheduler scheduler(provider, store, "p0", manual());
    provider.advance_to(5);
    ASSERT_EQ(scheduler.snapshot_now(), SnapshotOutcome::Written);

    EXPECT_EQ(scheduler.snapshot_now(), SnapshotOutcome::Skipped);
    EXPECT_EQ(store.store_count(), 1);
}

TEST_F(SnapshotSchedulerTest, StoreHoldingNewerSnapshotIsSkipped) {
    ASSERT_TRUE(store.store(Snapshot{"p0", 100, "{}", Timestamp(1)}));
    SnapshotScheduler scheduler(provider, store, "p0", manual());
    provider.advance_to(50);

    EXPECT_EQ(scheduler.snapshot_now(), SnapshotOutcome::Skipped);
    EXPECT_EQ(store.load_latest("p0")->sequence_number, 100);
}

TEST_F(SnapshotSchedulerTest, FailedWriteIsRetriedNextTime) {
    FailingSnapshotStore failing;
    SnapshotScheduler scheduler(provider, failing, "p0", manual());
    provider.advance_to(7);

    EXPECT_EQ(scheduler.snapshot_now(), SnapshotOutcome::Failed);
    EXPECT_EQ(scheduler.failures(), 1);
    EXPECT_EQ(scheduler.last_written_sequence(), -1);

    EXPECT_EQ(scheduler.snapshot_now(), SnapshotOutcome::Written);
    EXPECT_EQ(failing.inner.load_latest("p0")->sequence_number, 7);
}

// --- Background triggers ---

TEST_F(SnapshotSchedulerTest, EventCountTriggersSnapshot) {
    auto settings = manual();
    settings.event_count_threshold = 10;
    SnapshotScheduler scheduler(provider, store, "p0", settings);
    scheduler.start();

    provider.advance_to(4);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(store.has_snapshot("p0"));

    provider.advance_to(9);
    EXPECT_TRUE(eventually([&] { return scheduler.snapshots_written() == 1; }));
    EXPECT_EQ(store.load_latest("p0")->sequence_number, 9);

    scheduler.stop();
}

TEST_F(SnapshotSchedulerTest, IntervalTriggersSnapshot) {
    auto settings = manual();
    settings.interval_seconds = 1;
    SnapshotScheduler scheduler(provider, store, "p0", settings);
    provider.advance_to(3);
    scheduler.start();

    EXPECT_TRUE(eventually([&] { return store.has_snapshot("p0"); },
                           std::chrono::milliseconds(3000)));
    scheduler.stop();
}

TEST_F(SnapshotSchedulerTest, SnapshotOnStop) {
    auto settings = manual();
    settings.snapshot_on_stop = true;
    SnapshotScheduler scheduler(provider, store, "p0", settings);
    scheduler.start();
    provider.advance_to(12);

    scheduler.stop();

    EXPECT_EQ(store.load_latest("p0")->sequence_number, 12);
}

TEST_F(SnapshotSchedulerTest, StopIsIdempotent) {
    SnapshotScheduler scheduler(provider, store, "p0", manual());
    scheduler.stop();
    scheduler.start();
    scheduler.stop();
    scheduler.stop();
    EXPECT_EQ(scheduler.snapshots_written(), 0);
}
