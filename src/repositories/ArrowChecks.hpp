#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace cre::repositories {

// Turn Arrow's Status/Result returns into exceptions of the caller's choosing.
template <typename Error = std::runtime_error>
void check(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw Error(context + ": " + status.ToString());
    }
}

template <typename Error = std::runtime_error, typename T>
T value_or_throw(arrow::Result<T> result, const std::string& context) {
    if (!result.ok()) {
        throw Error(context + ": " + result.status().ToString());
    }
    return std::move(result).ValueOrDie();
}

} // namespace cre::repositories
