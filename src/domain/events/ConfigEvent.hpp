#pragma once

#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <string>

namespace cre::domain {

struct ConfigEvent {
    std::string partition_key;
    int64_t sequence_number;
    Timestamp enqueued_at;
};

} // namespace cre::domain
