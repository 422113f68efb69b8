#pragma once

#include "config/Settings.hpp"
#include "errors/ReplicationErrors.hpp"
#include "repositories/IArchiveWriter.hpp"
#include "services/ILiveLogReader.hpp"
#include "services/RetryBackoff.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cre::services {

// Tails one partition of the live log into the archive so the engine can
// replay it once the log's retention window has moved on.
//
// Disconnects and read timeouts resubscribe after the last captured event,
// backing off between attempts. If retention overtook the capture while it
// was disconnected, the lost range is logged and capture resumes at the
// floor. Malformed events propagate out of run().
class ArchiveCapture {
public:
    ArchiveCapture(ILiveLogReader& live_log,
                   cre::repositories::IArchiveWriter& writer,
                   std::string partition_key,
                   cre::config::ReplicationSettings settings = {});

    ArchiveCapture(const ArchiveCapture&) = delete;
    ArchiveCapture& operator=(const ArchiveCapture&) = delete;

    // Blocks until stop(). Starts at from_sequence, or at the retention
    // floor when none is given. Flushes the writer before returning.
    void run(std::optional<int64_t> from_sequence = std::nullopt);

    // Safe to call from any thread.
    void stop();

    uint64_t captured() const noexcept { return captured_; }
    uint64_t reconnect_count() const noexcept { return reconnects_; }
    // Events that expired from the log before they could be captured.
    uint64_t lost() const noexcept { return lost_; }
    // Next sequence to capture, or -1 before the first subscription.
    int64_t next_sequence_number() const noexcept { return next_sequence_number_; }

private:
    void tail();
    void skip_to(int64_t sequence, const std::string& reason);
    void wait_before_retry(const std::string& reason);

    ILiveLogReader& live_log_;
    cre::repositories::IArchiveWriter& writer_;
    std::string partition_key_;
    RetryBackoff backoff_;

    std::atomic<int64_t> next_sequence_number_{-1};
    std::atomic<uint64_t> captured_{0};
    std::atomic<uint64_t> reconnects_{0};
    std::atomic<uint64_t> lost_{0};
    std::atomic<bool> stop_requested_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<ILogSubscription> subscription_;
};

} // namespace cre::services
