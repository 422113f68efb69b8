#include "domain/value_objects/Timestamp.hpp"

#include <chrono>
#include <stdexcept>

namespace cre::domain {

Timestamp::Timestamp(int64_t milliseconds_since_epoch) : ms_(milliseconds_since_epoch) {
    if (milliseconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(milliseconds_since_epoch));
    }
}

Timestamp Timestamp::from_string(const std::string& str) {
    return Timestamp(std::stoll(str));
}

Timestamp Timestamp::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

} // namespace cre::domain
