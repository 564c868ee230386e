#pragma once

#include "utils/errors.h"

#include <arrow/result.h>
#include <arrow/status.h>

#include <string>
#include <utility>

namespace statlas {
namespace utils {

// Arrow reports failures as Status/Result; these convert them into the
// exception types used at module boundaries.
template<typename E = StatlasError>
void throwIfError(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw E(context + ": " + status.ToString());
    }
}

template<typename E = StatlasError, typename T>
T valueOrThrow(arrow::Result<T> result, const std::string& context) {
    if (!result.ok()) {
        throw E(context + ": " + result.status().ToString());
    }
    return std::move(result).ValueUnsafe();
}

} // namespace utils
} // namespace statlas
