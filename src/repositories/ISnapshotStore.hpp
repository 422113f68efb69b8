#pragma once

#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cre::repositories {

struct Snapshot {
    std::string partition_key;
    int64_t sequence_number;
    std::string payload;
    domain::Timestamp created_at;
};

class ISnapshotStore {
public:
    // Highest-sequence snapshot stored for the partition.
    virtual std::optional<Snapshot> load_latest(const std::string& partition_key) const = 0;

    // Returns false, writing nothing, when a snapshot at or above
    // snapshot.sequence_number is already stored. Throws
    // errors::SnapshotWriteError when the write itself fails.
    virtual bool store(const Snapshot& snapshot) = 0;

    virtual ~ISnapshotStore() = default;
};

} // namespace cre::repositories
