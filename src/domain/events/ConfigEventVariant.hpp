#pragma once

#include "domain/events/BrandUpdate.hpp"
#include "domain/events/MarkupUpdate.hpp"
#include "domain/events/SetDefaultMarkup.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace cre::domain {

using ConfigEventVariant = std::variant<MarkupUpdate, BrandUpdate, SetDefaultMarkup>;

inline int64_t sequence_of(const ConfigEventVariant& event) {
    return std::visit([](const auto& e) { return e.sequence_number; }, event);
}

inline const std::string& partition_of(const ConfigEventVariant& event) {
    return std::visit(
        [](const auto& e) -> const std::string& { return e.partition_key; }, event);
}

inline Timestamp enqueued_at_of(const ConfigEventVariant& event) {
    return std::visit([](const auto& e) { return e.enqueued_at; }, event);
}

} // namespace cre::domain
