#pragma once

#include "domain/events/ConfigEventVariant.hpp"
#include "domain/value_objects/BrandCode.hpp"
#include "domain/value_objects/MarkupRate.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cre::domain {

class ConfigState {
public:
    using MarkupMap = std::map<std::string, MarkupRate>;
    using BrandMap = std::map<BrandCode, std::string>;

    static constexpr int64_t kEmptySequenceNumber = -1;

    // Factories
    static ConfigState empty();
    static ConfigState restore(int64_t as_of_sequence_number, MarkupRate default_markup,
                               MarkupMap markups, BrandMap brands, Timestamp last_updated);
    static ConfigState replay(ConfigState state, const std::vector<ConfigEventVariant>& events);

    // Apply events. Returns a new ConfigState; maps untouched by the event
    // are shared with this instance.
    ConfigState apply(const MarkupUpdate& event) const;
    ConfigState apply(const BrandUpdate& event) const;
    ConfigState apply(const SetDefaultMarkup& event) const;
    ConfigState apply(const ConfigEventVariant& event) const;

    // Queries
    int64_t get_as_of_sequence_number() const noexcept { return as_of_sequence_number_; }
    bool is_empty() const noexcept { return as_of_sequence_number_ == kEmptySequenceNumber; }
    MarkupRate get_default_markup() const noexcept { return default_markup_; }
    Timestamp get_last_updated() const noexcept { return last_updated_; }
    const MarkupMap& get_markups() const noexcept { return *markups_; }
    const BrandMap& get_brands() const noexcept { return *brands_; }
    size_t markup_count() const noexcept { return markups_->size(); }
    size_t brand_count() const noexcept { return brands_->size(); }

    // Category rate, or the default rate when the category has no entry.
    MarkupRate markup_for(const std::string& category) const;
    std::optional<MarkupRate> find_markup(const std::string& category) const;
    std::optional<std::string> brand_name(const BrandCode& code) const;

    bool operator==(const ConfigState& other) const;

private:
    ConfigState(int64_t as_of_sequence_number, MarkupRate default_markup,
                std::shared_ptr<const MarkupMap> markups, std::shared_ptr<const BrandMap> brands,
                Timestamp last_updated);

    int64_t as_of_sequence_number_;
    MarkupRate default_markup_;
    std::shared_ptr<const MarkupMap> markups_;
    std::shared_ptr<const BrandMap> brands_;
    Timestamp last_updated_;
};

} // namespace cre::domain
