#include "domain/aggregates/ConfigState.hpp"

#include <utility>

namespace cre::domain {

ConfigState::ConfigState(int64_t as_of_sequence_number, MarkupRate default_markup,
                         std::shared_ptr<const MarkupMap> markups,
                         std::shared_ptr<const BrandMap> brands, Timestamp last_updated)
    : as_of_sequence_number_(as_of_sequence_number)
    , default_markup_(default_markup)
    , markups_(std::move(markups))
    , brands_(std::move(brands))
    , last_updated_(last_updated) {}

ConfigState ConfigState::empty() {
    return ConfigState(kEmptySequenceNumber, MarkupRate::zero(),
                       std::make_shared<const MarkupMap>(), std::make_shared<const BrandMap>(),
                       Timestamp(0));
}

ConfigState ConfigState::restore(int64_t as_of_sequence_number, MarkupRate default_markup,
                                 MarkupMap markups, BrandMap brands, Timestamp last_updated) {
    return ConfigState(as_of_sequence_number, default_markup,
                       std::make_shared<const MarkupMap>(std::move(markups)),
                       std::make_shared<const BrandMap>(std::move(brands)),
                       last_updated);
}

ConfigState ConfigState::replay(ConfigState state, const std::vector<ConfigEventVariant>& events) {
    for (const auto& event : events) {
        state = state.apply(event);
    }
    return state;
}

// MarkupUpdate: a non-positive rate removes the category
ConfigState ConfigState::apply(const MarkupUpdate& event) const {
    auto markups = std::make_shared<MarkupMap>(*markups_);
    if (event.price.is_positive()) {
        markups->insert_or_assign(event.category, event.price);
    } else {
        markups->erase(event.category);
    }

    return ConfigState(event.sequence_number, default_markup_,
                       std::move(markups), brands_, event.enqueued_at);
}

// BrandUpdate: an empty name removes the brand
ConfigState ConfigState::apply(const BrandUpdate& event) const {
    auto brands = std::make_shared<BrandMap>(*brands_);
    if (!event.name.empty()) {
        brands->insert_or_assign(event.code, event.name);
    } else {
        brands->erase(event.code);
    }

    return ConfigState(event.sequence_number, default_markup_,
                       markups_, std::move(brands), event.enqueued_at);
}

ConfigState ConfigState::apply(const SetDefaultMarkup& event) const {
    auto rate = event.price.is_positive() ? event.price : MarkupRate::zero();
    return ConfigState(event.sequence_number, rate,
                       markups_, brands_, event.enqueued_at);
}

// Variant dispatch
ConfigState ConfigState::apply(const ConfigEventVariant& event) const {
    return std::visit([this](const auto& e) { return this->apply(e); }, event);
}

MarkupRate ConfigState::markup_for(const std::string& category) const {
    return find_markup(category).value_or(default_markup_);
}

std::optional<MarkupRate> ConfigState::find_markup(const std::string& category) const {
    auto it = markups_->find(category);
    if (it == markups_->end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ConfigState::brand_name(const BrandCode& code) const {
    auto it = brands_->find(code);
    if (it == brands_->end()) return std::nullopt;
    return it->second;
}

bool ConfigState::operator==(const ConfigState& other) const {
    return as_of_sequence_number_ == other.as_of_sequence_number_
        && default_markup_ == other.default_markup_
        && last_updated_ == other.last_updated_
        && *markups_ == *other.markups_
        && *brands_ == *other.brands_;
}

} // namespace cre::domain
