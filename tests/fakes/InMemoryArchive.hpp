#pragma once

#include "errors/ReplicationErrors.hpp"
#include "repositories/IArchiveReader.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace cre::testing {

// Archive double keyed by sequence number. Coverage is checked up front,
// so a missing event fails read_range before anything is yielded.
class InMemoryArchive : public cre::repositories::IArchiveReader {
public:
    void add(const cre::domain::ConfigEventVariant& event) {
        std::lock_guard lock(mutex_);
        events_.insert_or_assign(cre::domain::sequence_of(event), event);
    }

    void add_all(const std::vector<cre::domain::ConfigEventVariant>& events) {
        for (const auto& event : events) add(event);
    }

    void fail_reads(int count) {
        std::lock_guard lock(mutex_);
        failing_reads_ = count;
    }

    std::unique_ptr<cre::repositories::IEventCursor> read_range(
        const std::string& partition_key, int64_t from, int64_t to) const override {
        std::lock_guard lock(mutex_);
        reads_.emplace_back(from, to);
        if (failing_reads_ > 0) {
            --failing_reads_;
            throw cre::errors::TransientTransportError("archive unreachable");
        }

        std::vector<cre::domain::ConfigEventVariant> slice;
        for (int64_t seq = from; seq < to; ++seq) {
            auto it = events_.find(seq);
            if (it == events_.end()) {
                throw cre::errors::RangeUnavailableError(partition_key, seq, to, "not archived");
            }
            slice.push_back(it->second);
        }
        return std::make_unique<Cursor>(std::move(slice));
    }

    // Test helpers
    std::vector<std::pair<int64_t, int64_t>> reads() const {
        std::lock_guard lock(mutex_);
        return reads_;
    }

private:
    class Cursor : public cre::repositories::IEventCursor {
    public:
        explicit Cursor(std::vector<cre::domain::ConfigEventVariant> events)
            : events_(std::move(events)) {}

        std::optional<cre::domain::ConfigEventVariant> next() override {
            if (index_ >= events_.size()) return std::nullopt;
            return events_[index_++];
        }

    private:
        std::vector<cre::domain::ConfigEventVariant> events_;
        size_t index_{0};
    };

    mutable std::mutex mutex_;
    std::map<int64_t, cre::domain::ConfigEventVariant> events_;
    mutable int failing_reads_{0};
    mutable std::vector<std::pair<int64_t, int64_t>> reads_;
};

} // namespace cre::testing
