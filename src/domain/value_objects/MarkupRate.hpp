#pragma once

#include <compare>
#include <string>

namespace cre::domain {

// A markup rate as published by the config store. Any finite value is
// representable; the reducer decides what a non-positive rate means.
class MarkupRate {
public:
    explicit MarkupRate(double value);

    static MarkupRate from_string(const std::string& str);
    static MarkupRate zero();

    double value() const noexcept { return value_; }
    bool is_positive() const noexcept { return value_ > 0.0; }

    bool operator==(const MarkupRate&) const = default;
    auto operator<=>(const MarkupRate&) const = default;

private:
    double value_;
};

} // namespace cre::domain
