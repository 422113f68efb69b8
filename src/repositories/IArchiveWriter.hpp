#pragma once

#include "domain/events/ConfigEventVariant.hpp"

namespace cre::repositories {

class IArchiveWriter {
public:
    // Events are appended in sequence order; replays of already appended
    // sequences are ignored.
    virtual void append(const domain::ConfigEventVariant& event) = 0;
    virtual void flush() = 0;
    // Flushes only when the writer's size or age limit has been reached.
    virtual void flush_if_due() = 0;

    virtual ~IArchiveWriter() = default;
};

} // namespace cre::repositories
