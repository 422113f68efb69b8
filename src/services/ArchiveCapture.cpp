#include "services/ArchiveCapture.hpp"

#include <iostream>
#include <utility>

using namespace cre::domain;

namespace cre::services {

ArchiveCapture::ArchiveCapture(ILiveLogReader& live_log,
                               cre::repositories::IArchiveWriter& writer,
                               std::string partition_key,
                               cre::config::ReplicationSettings settings)
    : live_log_(live_log)
    , writer_(writer)
    , partition_key_(std::move(partition_key))
    , backoff_(settings) {}

void ArchiveCapture::run(std::optional<int64_t> from_sequence) {
    if (from_sequence) {
        next_sequence_number_ = *from_sequence;
    }

    while (!stop_requested_) {
        try {
            int64_t floor = live_log_.oldest_available_sequence(partition_key_);
            if (next_sequence_number_ < 0) {
                next_sequence_number_ = floor;
            } else if (next_sequence_number_ < floor) {
                skip_to(floor, "expired from the log before capture");
            }
            tail();
        } catch (const errors::TransientTransportError& e) {
            ++reconnects_;
            wait_before_retry(e.what());
        }
    }

    writer_.flush();
    std::cout << "[capture] Stopped partition '" << partition_key_ << "' at #"
              << next_sequence_number_ << " (" << captured_ << " captured, "
              << lost_ << " lost)" << std::endl;
}

void ArchiveCapture::stop() {
    stop_requested_ = true;

    std::shared_ptr<ILogSubscription> subscription;
    {
        std::lock_guard lock(mutex_);
        subscription = subscription_;
    }
    if (subscription) {
        subscription->cancel();
    }
    cv_.notify_all();
}

void ArchiveCapture::tail() {
    std::shared_ptr<ILogSubscription> subscription =
        live_log_.subscribe(partition_key_, next_sequence_number_);
    {
        std::lock_guard lock(mutex_);
        if (stop_requested_) subscription->cancel();
        subscription_ = subscription;
    }

    auto release = [this] {
        std::lock_guard lock(mutex_);
        subscription_.reset();
    };

    std::cout << "[capture] Archiving partition '" << partition_key_ << "' from #"
              << next_sequence_number_ << std::endl;

    try {
        while (!stop_requested_) {
            auto event = subscription->next();
            if (!event) break;  // cancelled

            auto seq = sequence_of(*event);
            if (seq < next_sequence_number_) continue;
            if (seq > next_sequence_number_) {
                skip_to(seq, "missing from the log");
            }

            writer_.append(*event);
            next_sequence_number_ = seq + 1;
            ++captured_;
            backoff_.reset();
        }
    } catch (...) {
        release();
        throw;
    }
    release();
}

void ArchiveCapture::skip_to(int64_t sequence, const std::string& reason) {
    int64_t from = next_sequence_number_;
    lost_ += static_cast<uint64_t>(sequence - from);
    std::cerr << "[capture] Events [" << from << ", " << sequence << ") of partition '"
              << partition_key_ << "' " << reason << std::endl;
    next_sequence_number_ = sequence;
}

void ArchiveCapture::wait_before_retry(const std::string& reason) {
    auto delay = backoff_.next_delay();
    std::cerr << "[capture] " << reason << "; resubscribing in " << delay.count() << "ms"
              << std::endl;

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

} // namespace cre::services
