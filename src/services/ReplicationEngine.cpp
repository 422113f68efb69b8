#include "services/ReplicationEngine.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

using namespace cre::domain;

namespace cre::services {

namespace {

// Thrown inside the driver when stop() interrupts a retry loop.
struct StopRequested {};

} // namespace

std::string to_string(EnginePhase phase) {
    switch (phase) {
        case EnginePhase::Idle: return "idle";
        case EnginePhase::Bootstrapping: return "bootstrapping";
        case EnginePhase::ArchiveCatchUp: return "archive_catch_up";
        case EnginePhase::LiveStreaming: return "live_streaming";
        case EnginePhase::Stopped: return "stopped";
        case EnginePhase::Failed: return "failed";
    }
    return "unknown";
}

ReplicationEngine::ReplicationEngine(cre::repositories::ISnapshotStore& snapshots,
                                     cre::repositories::IArchiveReader& archive,
                                     ILiveLogReader& live_log,
                                     std::string partition_key,
                                     cre::config::ReplicationSettings settings)
    : snapshots_(snapshots)
    , archive_(archive)
    , live_log_(live_log)
    , partition_key_(std::move(partition_key))
    , settings_(settings)
    , backoff_(settings_)
    , state_(std::make_shared<const ConfigState>(ConfigState::empty())) {}

ReplicationEngine::~ReplicationEngine() {
    stop();
}

void ReplicationEngine::start() {
    {
        std::lock_guard lock(mutex_);
        if (phase_ != EnginePhase::Idle || driver_.joinable()) {
            throw std::logic_error("ReplicationEngine already started");
        }
        phase_ = EnginePhase::Bootstrapping;
        driver_ = std::thread([this] { run(); });
    }

    std::exception_ptr error;
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return live_ready_ || finished_; });
        error = startup_error_;
    }

    if (error) {
        {
            std::lock_guard join_lock(join_mutex_);
            if (driver_.joinable()) driver_.join();
        }
        std::rethrow_exception(error);
    }
}

void ReplicationEngine::stop() {
    stop_requested_ = true;

    std::shared_ptr<ILogSubscription> subscription;
    bool joinable = false;
    {
        std::lock_guard lock(mutex_);
        subscription = subscription_;
        joinable = driver_.joinable() && driver_.get_id() != std::this_thread::get_id();
    }
    if (subscription) {
        subscription->cancel();
    }
    cv_.notify_all();

    if (joinable) {
        std::lock_guard join_lock(join_mutex_);
        if (driver_.joinable()) driver_.join();
    }

    auto idle = EnginePhase::Idle;
    phase_.compare_exchange_strong(idle, EnginePhase::Stopped);
}

std::shared_ptr<const ConfigState> ReplicationEngine::current_state() const {
    return state_.load();
}

std::string ReplicationEngine::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

ApplyOutcome ReplicationEngine::on_event(const ConfigEventVariant& event) {
    auto seq = sequence_of(event);
    auto expected = next_sequence_number_.load();

    if (partition_of(event) != partition_key_) {
        throw errors::MalformedEventError(
            "belongs to partition '" + partition_of(event) + "', not '" + partition_key_ + "'",
            seq);
    }
    if (seq < expected) {
        ++duplicates_skipped_;
        std::cout << "[engine] Skipped duplicate #" << seq
                  << " (next #" << expected << ")" << std::endl;
        return ApplyOutcome::DuplicateSkipped;
    }
    if (seq > expected) {
        throw errors::SequenceGapError(expected, seq);
    }

    publish(current_state()->apply(event));
    next_sequence_number_ = seq + 1;
    ++events_applied_;
    return ApplyOutcome::Applied;
}

void ReplicationEngine::publish(ConfigState state) {
    state_.store(std::make_shared<const ConfigState>(std::move(state)));
}

// --- Driver ---

void ReplicationEngine::run() {
    try {
        bootstrap();

        while (!stop_requested_) {
            try {
                catch_up_from_archive();
                stream_live();
            } catch (const errors::TransientTransportError& e) {
                ++reconnects_;
                wait_before_retry(e.what());
            }
        }
    } catch (const StopRequested&) {
        // stop() landed inside a retry loop; fall through to Stopped
    } catch (const std::exception& e) {
        fail(std::current_exception(), e.what());
        return;
    }

    phase_ = EnginePhase::Stopped;
    {
        std::lock_guard lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
    std::cout << "[engine] Stopped at #" << next_sequence_number_ - 1 << std::endl;
}

template <typename Operation>
auto ReplicationEngine::with_retry(const std::string& what, Operation&& op) {
    while (true) {
        if (stop_requested_) throw StopRequested{};
        try {
            return op();
        } catch (const errors::TransientTransportError& e) {
            ++reconnects_;
            wait_before_retry(what + ": " + e.what());
        }
    }
}

void ReplicationEngine::bootstrap() {
    phase_ = EnginePhase::Bootstrapping;

    auto snapshot = with_retry("load snapshot", [this] {
        return snapshots_.load_latest(partition_key_);
    });
    backoff_.reset();

    if (!snapshot) {
        std::cout << "[engine] No snapshot for partition '" << partition_key_
                  << "', starting from the empty state" << std::endl;
        next_sequence_number_ = 0;
        return;
    }

    auto state = codec_.decode_state(snapshot->payload);
    if (state.get_as_of_sequence_number() != snapshot->sequence_number) {
        throw errors::MalformedEventError(
            "snapshot stored as #" + std::to_string(snapshot->sequence_number)
            + " holds state as of #" + std::to_string(state.get_as_of_sequence_number()));
    }

    next_sequence_number_ = state.get_as_of_sequence_number() + 1;
    publish(std::move(state));
    std::cout << "[engine] Restored snapshot #" << snapshot->sequence_number
              << " for partition '" << partition_key_ << "'" << std::endl;
}

void ReplicationEngine::catch_up_from_archive() {
    phase_ = EnginePhase::ArchiveCatchUp;

    // The floor is the first sequence the live log still holds, so a cursor
    // equal to it needs nothing from the archive.
    int64_t floor = live_log_.oldest_available_sequence(partition_key_);
    int64_t from = next_sequence_number_;
    if (from >= floor) return;

    std::cout << "[archive] Replaying [" << from << ", " << floor << ") for partition '"
              << partition_key_ << "'" << std::endl;

    auto cursor = archive_.read_range(partition_key_, from, floor);
    while (!stop_requested_) {
        try {
            auto event = cursor->next();
            if (!event) break;
            on_event(*event);
        } catch (const errors::MalformedEventError& e) {
            on_malformed(e);
        }
    }

    if (stop_requested_) throw StopRequested{};

    if (next_sequence_number_ < floor) {
        throw errors::RangeUnavailableError(partition_key_, next_sequence_number_, floor,
                                            "archive ended before the live floor");
    }
    std::cout << "[archive] Caught up to #" << next_sequence_number_ - 1 << std::endl;
}

void ReplicationEngine::stream_live() {
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

    mark_live();

    try {
        while (!stop_requested_) {
            try {
                auto event = subscription->next();
                if (!event) break;  // cancelled
                on_event(*event);
            } catch (const errors::MalformedEventError& e) {
                on_malformed(e);
                continue;
            }
            backoff_.reset();
        }
    } catch (...) {
        release();
        throw;
    }
    release();
}

void ReplicationEngine::mark_live() {
    phase_ = EnginePhase::LiveStreaming;
    bool first = false;
    {
        std::lock_guard lock(mutex_);
        first = !live_ready_;
        live_ready_ = true;
    }
    if (first) {
        cv_.notify_all();
    }
    std::cout << "[engine] Streaming partition '" << partition_key_ << "' from #"
              << next_sequence_number_ << std::endl;
}

void ReplicationEngine::on_malformed(const errors::MalformedEventError& error) {
    if (settings_.malformed_event_policy == cre::config::MalformedEventPolicy::Fail) {
        throw error;
    }

    auto seq = error.sequence_number();
    auto expected = next_sequence_number_.load();
    if (seq && *seq > expected) {
        throw errors::SequenceGapError(expected, *seq);
    }

    ++malformed_skipped_;
    std::cerr << "[engine] Skipping " << error.what() << std::endl;
    if (seq && *seq == expected) {
        next_sequence_number_ = expected + 1;
    }
}

void ReplicationEngine::fail(std::exception_ptr error, const std::string& what) {
    std::cerr << "[engine] Fatal on partition '" << partition_key_ << "': " << what << std::endl;
    phase_ = EnginePhase::Failed;
    {
        std::lock_guard lock(mutex_);
        last_error_ = what;
        if (!live_ready_) {
            startup_error_ = std::move(error);
        }
        finished_ = true;
    }
    cv_.notify_all();
}

void ReplicationEngine::wait_before_retry(const std::string& reason) {
    auto delay = backoff_.next_delay();
    std::cerr << "[engine] " << reason << "; retrying in " << delay.count() << "ms" << std::endl;

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

} // namespace cre::services
