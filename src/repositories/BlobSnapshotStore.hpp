#pragma once

#include "repositories/ISnapshotStore.hpp"

#include <arrow/filesystem/api.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cre::repositories {

// Snapshots as JSON blobs keyed {prefix}/{partition}/{sequence:020}.json.
// The latest snapshot is the one with the highest sequence number.
class BlobSnapshotStore : public cre::repositories::ISnapshotStore {
public:
    BlobSnapshotStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string prefix);

    std::optional<Snapshot> load_latest(const std::string& partition_key) const override;
    bool store(const Snapshot& snapshot) override;

    std::string snapshot_path(const std::string& partition_key, int64_t sequence_number) const;

private:
    std::string partition_dir(const std::string& partition_key) const;
    std::optional<int64_t> latest_sequence(const std::string& partition_key) const;

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    std::string prefix_;
    mutable std::mutex mutex_;
};

} // namespace cre::repositories
