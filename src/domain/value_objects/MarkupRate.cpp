#include "domain/value_objects/MarkupRate.hpp"

#include <cmath>
#include <stdexcept>

namespace cre::domain {

MarkupRate::MarkupRate(double value) : value_(value) {
    if (!std::isfinite(value)) {
        throw std::out_of_range("MarkupRate must be finite");
    }
}

MarkupRate MarkupRate::from_string(const std::string& str) {
    return MarkupRate(std::stod(str));
}

MarkupRate MarkupRate::zero() {
    return MarkupRate(0.0);
}

} // namespace cre::domain
