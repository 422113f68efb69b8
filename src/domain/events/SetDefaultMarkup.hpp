#pragma once

#include "domain/events/ConfigEvent.hpp"
#include "domain/value_objects/MarkupRate.hpp"

namespace cre::domain {

struct SetDefaultMarkup : ConfigEvent {
    MarkupRate price;
};

} // namespace cre::domain
