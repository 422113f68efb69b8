#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace cre::errors {

class ReplicationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Disconnects, timeouts, failed connects. Retried with backoff by the engine.
class TransientTransportError : public ReplicationError {
public:
    using ReplicationError::ReplicationError;
};

// The archive cannot satisfy a contiguous sequence range.
class RangeUnavailableError : public ReplicationError {
public:
    RangeUnavailableError(std::string partition_key, int64_t from_inclusive,
                          int64_t to_exclusive, const std::string& detail)
        : ReplicationError("Range [" + std::to_string(from_inclusive) + ", "
                           + std::to_string(to_exclusive) + ") unavailable for partition '"
                           + partition_key + "': " + detail)
        , partition_key_(std::move(partition_key))
        , from_(from_inclusive)
        , to_(to_exclusive) {}

    const std::string& partition_key() const noexcept { return partition_key_; }
    int64_t from_inclusive() const noexcept { return from_; }
    int64_t to_exclusive() const noexcept { return to_; }

private:
    std::string partition_key_;
    int64_t from_;
    int64_t to_;
};

// The stream delivered a sequence number ahead of the cursor.
class SequenceGapError : public ReplicationError {
public:
    SequenceGapError(int64_t expected, int64_t received)
        : ReplicationError("Sequence gap: expected #" + std::to_string(expected)
                           + ", received #" + std::to_string(received))
        , expected_(expected)
        , received_(received) {}

    int64_t expected() const noexcept { return expected_; }
    int64_t received() const noexcept { return received_; }

private:
    int64_t expected_;
    int64_t received_;
};

// Decode failure. Carries the sequence number when the envelope was readable.
class MalformedEventError : public ReplicationError {
public:
    explicit MalformedEventError(const std::string& reason,
                                 std::optional<int64_t> sequence_number = std::nullopt)
        : ReplicationError(sequence_number
                               ? "Malformed event #" + std::to_string(*sequence_number) + ": " + reason
                               : "Malformed event: " + reason)
        , sequence_number_(sequence_number) {}

    std::optional<int64_t> sequence_number() const noexcept { return sequence_number_; }

private:
    std::optional<int64_t> sequence_number_;
};

class SnapshotWriteError : public ReplicationError {
public:
    using ReplicationError::ReplicationError;
};

} // namespace cre::errors
