#pragma once

#include "domain/aggregates/ConfigState.hpp"

#include <cstdint>
#include <memory>

namespace cre::services {

class IStateProvider {
public:
    virtual std::shared_ptr<const domain::ConfigState> current_state() const = 0;
    virtual uint64_t events_applied() const = 0;
    virtual ~IStateProvider() = default;
};

} // namespace cre::services
