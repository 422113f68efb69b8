#pragma once

#include "domain/events/ConfigEventVariant.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace cre::services {

// A tailing read of one partition.
class ILogSubscription {
public:
    // Blocks until the next event arrives. Returns std::nullopt once the
    // subscription has been cancelled. Throws errors::TransientTransportError
    // on disconnect or read timeout, errors::MalformedEventError when a
    // message cannot be decoded.
    virtual std::optional<domain::ConfigEventVariant> next() = 0;

    // Safe to call from any thread; wakes a blocked next().
    virtual void cancel() = 0;

    virtual ~ILogSubscription() = default;
};

class ILiveLogReader {
public:
    // Oldest sequence number still retained for the partition (inclusive).
    virtual int64_t oldest_available_sequence(const std::string& partition_key) const = 0;

    virtual std::unique_ptr<ILogSubscription> subscribe(const std::string& partition_key,
                                                        int64_t from_sequence_inclusive) = 0;

    virtual ~ILiveLogReader() = default;
};

} // namespace cre::services
