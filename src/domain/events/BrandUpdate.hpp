#pragma once

#include "domain/events/ConfigEvent.hpp"
#include "domain/value_objects/BrandCode.hpp"

#include <string>

namespace cre::domain {

struct BrandUpdate : ConfigEvent {
    BrandCode code;
    std::string name;
};

} // namespace cre::domain
