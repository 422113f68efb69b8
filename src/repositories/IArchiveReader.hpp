#pragma once

#include "domain/events/ConfigEventVariant.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace cre::repositories {

// Lazy, finite, ordered sequence of archived events.
class IEventCursor {
public:
    // Next event, or std::nullopt when the range is exhausted. A cursor that
    // threw errors::MalformedEventError can keep being read past the bad event.
    virtual std::optional<domain::ConfigEventVariant> next() = 0;
    virtual ~IEventCursor() = default;
};

class IArchiveReader {
public:
    // Events [from, to) in sequence order. Throws errors::RangeUnavailableError
    // when any part of the range is missing rather than yielding a prefix.
    // Every call returns an independent cursor, so a failed read can be
    // retried from wherever the caller got to.
    virtual std::unique_ptr<IEventCursor> read_range(const std::string& partition_key,
                                                     int64_t from_sequence_inclusive,
                                                     int64_t to_sequence_exclusive) const = 0;

    virtual ~IArchiveReader() = default;
};

} // namespace cre::repositories
