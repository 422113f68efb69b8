#pragma once

#include "domain/events/ConfigEvent.hpp"
#include "domain/value_objects/MarkupRate.hpp"

#include <string>

namespace cre::domain {

struct MarkupUpdate : ConfigEvent {
    std::string category;
    MarkupRate price;
};

} // namespace cre::domain
