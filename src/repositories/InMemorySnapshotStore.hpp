#pragma once

#include "repositories/ISnapshotStore.hpp"

#include <map>
#include <mutex>

namespace cre::repositories {

class InMemorySnapshotStore : public cre::repositories::ISnapshotStore {
public:
    std::optional<Snapshot> load_latest(const std::string& partition_key) const override {
        std::lock_guard lock(mutex_);
        auto it = latest_.find(partition_key);
        if (it != latest_.end()) return it->second;
        return std::nullopt;
    }

    bool store(const Snapshot& snapshot) override {
        std::lock_guard lock(mutex_);
        auto it = latest_.find(snapshot.partition_key);
        if (it != latest_.end() && it->second.sequence_number >= snapshot.sequence_number) {
            return false;
        }
        latest_.insert_or_assign(snapshot.partition_key, snapshot);
        ++store_count_;
        return true;
    }

    // Test helpers
    size_t store_count() const {
        std::lock_guard lock(mutex_);
        return store_count_;
    }
    bool has_snapshot(const std::string& partition_key) const {
        std::lock_guard lock(mutex_);
        return latest_.count(partition_key) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Snapshot> latest_;
    size_t store_count_{0};
};

} // namespace cre::repositories
