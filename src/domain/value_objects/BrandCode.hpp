#pragma once

#include <compare>
#include <string>

namespace cre::domain {

class BrandCode {
public:
    explicit BrandCode(std::string code);

    const std::string& value() const noexcept { return code_; }

    bool operator==(const BrandCode&) const = default;
    auto operator<=>(const BrandCode&) const = default;

private:
    std::string code_;
};

} // namespace cre::domain
