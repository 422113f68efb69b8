#include "domain/aggregates/ConfigState.hpp"

#include "fakes/EventFactory.hpp"

#include <gtest/gtest.h>

using namespace cre::domain;
using cre::testing::brand;
using cre::testing::counting_markups;
using cre::testing::default_markup;
using cre::testing::markup;

// --- Factory ---

TEST(ConfigState, EmptyStateHasNoEntries) {
    auto state = ConfigState::empty();

    EXPECT_TRUE(state.is_empty());
    EXPECT_EQ(state.get_as_of_sequence_number(), ConfigState::kEmptySequenceNumber);
    EXPECT_TRUE(state.get_markups().empty());
    EXPECT_TRUE(state.get_brands().empty());
    EXPECT_EQ(state.get_default_markup(), MarkupRate::zero());
    EXPECT_EQ(state.get_last_updated(), Timestamp(0));
}

TEST(ConfigState, RestoreKeepsEverything) {
    auto state = ConfigState::restore(409, MarkupRate(0.05),
                                      {{"shoes", MarkupRate(0.2)}},
                                      {{BrandCode("ACME"), "Acme Corp"}},
                                      Timestamp(5000));

    EXPECT_FALSE(state.is_empty());
    EXPECT_EQ(state.get_as_of_sequence_number(), 409);
    EXPECT_EQ(state.markup_for("shoes"), MarkupRate(0.2));
    EXPECT_EQ(state.brand_name(BrandCode("ACME")), "Acme Corp");
    EXPECT_EQ(state.get_last_updated(), Timestamp(5000));
}

// --- Apply MarkupUpdate ---

TEST(ConfigState, MarkupUpdateSetsCategory) {
    auto state = ConfigState::empty().apply(markup(0, "shoes", 0.2));

    EXPECT_EQ(state.get_as_of_sequence_number(), 0);
    EXPECT_EQ(state.find_markup("shoes"), MarkupRate(0.2));
    EXPECT_EQ(state.get_last_updated(), Timestamp(1000));
}

TEST(ConfigState, MarkupUpdateOverwritesCategory) {
    auto state = ConfigState::empty()
        .apply(markup(0, "shoes", 0.2))
        .apply(markup(1, "shoes", 0.3));

    EXPECT_EQ(state.find_markup("shoes"), MarkupRate(0.3));
    EXPECT_EQ(state.markup_count(), 1);
}

TEST(ConfigState, NegativeRateRemovesCategory) {
    auto state = ConfigState::empty()
        .apply(markup(0, "shoes", 0.2))
        .apply(markup(1, "hats", 0.1))
        .apply(markup(2, "shoes", -1.0));

    EXPECT_FALSE(state.find_markup("shoes").has_value());
    EXPECT_EQ(state.find_markup("hats"), MarkupRate(0.1));
    EXPECT_EQ(state.get_as_of_sequence_number(), 2);
}

TEST(ConfigState, ZeroRateRemovesCategory) {
    auto state = ConfigState::empty()
        .apply(markup(0, "shoes", 0.2))
        .apply(markup(1, "shoes", 0.0));

    EXPECT_TRUE(state.get_markups().empty());
}

TEST(ConfigState, RemovingUnknownCategoryStillAdvances) {
    auto state = ConfigState::empty().apply(markup(0, "ghost", -1.0));

    EXPECT_TRUE(state.get_markups().empty());
    EXPECT_EQ(state.get_as_of_sequence_number(), 0);
}

TEST(ConfigState, MarkupForFallsBackToDefault) {
    auto state = ConfigState::empty()
        .apply(default_markup(0, 0.07))
        .apply(markup(1, "shoes", 0.2));

    EXPECT_EQ(state.markup_for("shoes"), MarkupRate(0.2));
    EXPECT_EQ(state.markup_for("unknown"), MarkupRate(0.07));
}

// --- Apply BrandUpdate ---

TEST(ConfigState, BrandUpdateSetsName) {
    auto state = ConfigState::empty().apply(brand(0, "ACME", "Acme Corp"));
    EXPECT_EQ(state.brand_name(BrandCode("ACME")), "Acme Corp");
}

TEST(ConfigState, EmptyBrandNameRemovesBrand) {
    auto state = ConfigState::empty()
        .apply(brand(0, "ACME", "Acme Corp"))
        .apply(brand(1, "ACME", ""));

    EXPECT_FALSE(state.brand_name(BrandCode("ACME")).has_value());
    EXPECT_EQ(state.brand_count(), 0);
}

// --- Apply SetDefaultMarkup ---

TEST(ConfigState, SetDefaultMarkup) {
    auto state = ConfigState::empty().apply(default_markup(0, 0.05));
    EXPECT_EQ(state.get_default_markup(), MarkupRate(0.05));
}

TEST(ConfigState, NonPositiveDefaultResetsToZero) {
    auto state = ConfigState::empty()
        .apply(default_markup(0, 0.05))
        .apply(default_markup(1, -2.0));

    EXPECT_EQ(state.get_default_markup(), MarkupRate::zero());
}

// --- Immutability ---

TEST(ConfigState, ApplyLeavesOriginalUntouched) {
    auto before = ConfigState::empty().apply(markup(0, "shoes", 0.2));
    auto after = before.apply(markup(1, "shoes", -1.0));

    EXPECT_EQ(before.find_markup("shoes"), MarkupRate(0.2));
    EXPECT_EQ(before.get_as_of_sequence_number(), 0);
    EXPECT_FALSE(after.find_markup("shoes").has_value());
}

TEST(ConfigState, UntouchedMapsAreShared) {
    auto before = ConfigState::empty()
        .apply(markup(0, "shoes", 0.2))
        .apply(brand(1, "ACME", "Acme Corp"));
    auto after = before.apply(brand(2, "BOLT", "Bolt Ltd"));

    EXPECT_EQ(&before.get_markups(), &after.get_markups());
    EXPECT_NE(&before.get_brands(), &after.get_brands());
}

// --- Replay ---

TEST(ConfigState, ReplayIsDeterministic) {
    std::vector<ConfigEventVariant> events{
        markup(0, "shoes", 0.2), brand(1, "ACME", "Acme Corp"), default_markup(2, 0.05),
        markup(3, "hats", 0.1), markup(4, "shoes", -1.0), brand(5, "ACME", ""),
    };

    auto a = ConfigState::replay(ConfigState::empty(), events);
    auto b = ConfigState::replay(ConfigState::empty(), events);

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.get_as_of_sequence_number(), 5);
    EXPECT_EQ(a.get_markups().size(), 1);
    EXPECT_TRUE(a.get_brands().empty());
}

TEST(ConfigState, ReplayFromIntermediateStateMatchesFullReplay) {
    auto events = counting_markups(0, 49);
    events.push_back(brand(50, "ACME", "Acme Corp"));
    events.push_back(markup(51, "cat", -1.0));

    for (size_t split : {size_t{0}, size_t{1}, size_t{25}, events.size()}) {
        std::vector<ConfigEventVariant> head(events.begin(), events.begin() + split);
        std::vector<ConfigEventVariant> tail(events.begin() + split, events.end());

        auto resumed = ConfigState::replay(ConfigState::replay(ConfigState::empty(), head), tail);
        EXPECT_EQ(resumed, ConfigState::replay(ConfigState::empty(), events)) << "split " << split;
    }
}

TEST(ConfigState, EqualityComparesContentsNotIdentity) {
    auto a = ConfigState::empty().apply(markup(0, "shoes", 0.2));
    auto b = ConfigState::restore(0, MarkupRate::zero(), {{"shoes", MarkupRate(0.2)}}, {},
                                  Timestamp(1000));
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == a.apply(markup(1, "shoes", 0.2)));
}
