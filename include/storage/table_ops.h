#pragma once

#include <arrow/api.h>
#include <arrow/compute/expression.h>

#include <memory>
#include <string>
#include <vector>

namespace statlas {
namespace storage {

using TablePtr = std::shared_ptr<arrow::Table>;

// In-memory compute over arrow::Table. Everything here is synchronous and
// touches no I/O; callable from any thread. Failures throw StatlasError.

/**
 * @brief Vertical union of tables in the given order
 *
 * Schemas are unified first: columns missing from one input are null-filled,
 * null-typed columns take the type seen elsewhere and numeric columns are
 * widened to a common type.
 */
TablePtr concatUnified(const std::vector<TablePtr>& tables);

/**
 * @brief One output row per element of a list column
 *
 * The list column is replaced by its element type. Rows whose list is null or
 * empty disappear.
 */
TablePtr explodeList(const TablePtr& table, const std::string& column);

struct JoinOptions {
    bool keep_right_key = false;
    std::string right_suffix = "_right";
};

/**
 * @brief Inner equi-join on one key column per side
 *
 * Keys are compared by their string form, so int and utf8 ids join. Output
 * follows left row order, then right row order for duplicate keys. Left
 * columns come first; right columns whose names clash get right_suffix.
 */
TablePtr innerJoin(const TablePtr& left, const TablePtr& right,
                   const std::string& left_key, const std::string& right_key,
                   const JoinOptions& options = {});

/// Registers the optional compute kernels once; filter() calls it itself
void ensureComputeKernels();

/// Rows for which the predicate is true (null counts as false); row order is kept
TablePtr filter(const TablePtr& table, const arrow::compute::Expression& predicate);

TablePtr moveColumnFirst(const TablePtr& table, const std::string& column);

/// @throws ValidationError if a column does not exist
TablePtr selectColumns(const TablePtr& table, const std::vector<std::string>& columns);

/// Zero-row table with the same schema
TablePtr emptyLike(const TablePtr& table);

/**
 * @brief Column values rendered as strings (nulls become "")
 * @throws ValidationError if the column does not exist
 */
std::vector<std::string> stringValues(const TablePtr& table, const std::string& column);

} // namespace storage
} // namespace statlas
