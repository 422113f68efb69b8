#include "domain/value_objects/BrandCode.hpp"

#include <stdexcept>

namespace cre::domain {

BrandCode::BrandCode(std::string code) : code_(std::move(code)) {
    if (code_.empty()) {
        throw std::invalid_argument("BrandCode must not be empty");
    }
}

} // namespace cre::domain
