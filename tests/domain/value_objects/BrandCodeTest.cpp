#include "domain/value_objects/BrandCode.hpp"

#include <gtest/gtest.h>

#include <map>

using cre::domain::BrandCode;

TEST(BrandCode, HoldsCode) {
    BrandCode code("ACME");
    EXPECT_EQ(code.value(), "ACME");
}

TEST(BrandCode, ThrowsOnEmpty) {
    EXPECT_THROW(BrandCode(""), std::invalid_argument);
}

TEST(BrandCode, UsableAsMapKey) {
    std::map<BrandCode, int> m;
    m[BrandCode("b")] = 2;
    m[BrandCode("a")] = 1;
    EXPECT_EQ(m.begin()->first.value(), "a");
    EXPECT_EQ(m.at(BrandCode("b")), 2);
}
