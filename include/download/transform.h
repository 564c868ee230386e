#pragma once

#include <arrow/api.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace statlas {
namespace download {

struct RenameColumnTransform {
    std::string from;
    std::string to;
};

struct SelectColumnsTransform {
    std::vector<std::string> columns;
};

/// Post-processing step applied to a materialized table
using Transform = std::variant<RenameColumnTransform, SelectColumnsTransform>;

/// @throws ValidationError if a referenced column does not exist
std::shared_ptr<arrow::Table> applyTransform(const Transform& transform, const std::shared_ptr<arrow::Table>& table);

/// Applies the transforms left to right
std::shared_ptr<arrow::Table> applyTransforms(const std::vector<Transform>& transforms,
                                              std::shared_ptr<arrow::Table> table);

} // namespace download
} // namespace statlas
