#include "storage/table_ops.h"
#include "utils/arrow_status.h"
#include "utils/errors.h"

#include <arrow/compute/api.h>
#include <arrow/compute/exec.h>
#include <arrow/util/config.h>
#if ARROW_VERSION_MAJOR >= 21
#include <arrow/compute/initialize.h>
#endif

#include <unordered_map>
#include <unordered_set>

namespace statlas {
namespace storage {

namespace cp = arrow::compute;
using utils::throwIfError;
using utils::valueOrThrow;

namespace {

int requireColumn(const TablePtr& table, const std::string& column) {
    int idx = table->schema()->GetFieldIndex(column);
    if (idx < 0) {
        throw ValidationError("column '" + column + "' not found");
    }
    return idx;
}

std::shared_ptr<arrow::Array> toInt64Array(const std::vector<int64_t>& values) {
    arrow::Int64Builder builder;
    throwIfError(builder.AppendValues(values), "index build");
    return valueOrThrow(builder.Finish(), "index build");
}

std::shared_ptr<arrow::ChunkedArray> takeColumn(const std::shared_ptr<arrow::ChunkedArray>& column,
                                                const std::shared_ptr<arrow::Array>& indices) {
    if (column->num_chunks() == 0) {
        auto empty = valueOrThrow(arrow::MakeEmptyArray(column->type()), "empty column");
        arrow::Datum taken = valueOrThrow(cp::Take(empty, indices), "take");
        return std::make_shared<arrow::ChunkedArray>(taken.make_array());
    }
    arrow::Datum taken = valueOrThrow(cp::Take(column, indices), "take");
    return taken.chunked_array();
}

// Key column as utf8 so ids of different integer/string types compare equal
std::shared_ptr<arrow::StringArray> keyStrings(const TablePtr& table, int idx) {
    auto column = table->column(idx);
    arrow::Datum as_string = valueOrThrow(cp::Cast(column, arrow::utf8()), "cast join key '" +
                                          table->schema()->field(idx)->name() + "'");
    const auto& chunks = as_string.chunked_array()->chunks();
    if (chunks.empty()) {
        return std::static_pointer_cast<arrow::StringArray>(
            valueOrThrow(arrow::MakeEmptyArray(arrow::utf8()), "empty key column"));
    }
    auto combined = valueOrThrow(arrow::Concatenate(chunks), "combine key chunks");
    return std::static_pointer_cast<arrow::StringArray>(combined);
}

} // namespace

void ensureComputeKernels() {
#if ARROW_VERSION_MAJOR >= 21
    // String and set-lookup kernels live in libarrow_compute and register on demand
    static const arrow::Status status = cp::Initialize();
    throwIfError(status, "initialize Arrow compute");
#endif
}

TablePtr concatUnified(const std::vector<TablePtr>& tables) {
    if (tables.empty()) {
        throw StatlasError("cannot union an empty list of tables");
    }
    if (tables.size() == 1) {
        return tables.front();
    }
    arrow::ConcatenateTablesOptions options;
    options.unify_schemas = true;
    options.field_merge_options = arrow::Field::MergeOptions::Permissive();
    auto result = valueOrThrow(arrow::ConcatenateTables(tables, options), "union tables");
    return valueOrThrow(result->CombineChunks(), "combine chunks");
}

TablePtr explodeList(const TablePtr& table, const std::string& column) {
    const int idx = requireColumn(table, column);
    const auto& field = table->schema()->field(idx);
    if (field->type()->id() != arrow::Type::LIST) {
        throw ValidationError("column '" + column + "' is not a list column");
    }
    const auto value_type = std::static_pointer_cast<arrow::ListType>(field->type())->value_type();

    std::vector<int64_t> parent;
    std::vector<int64_t> child;
    std::vector<std::shared_ptr<arrow::Array>> child_chunks;
    int64_t row_base = 0;
    int64_t child_base = 0;
    for (const auto& chunk : table->column(idx)->chunks()) {
        auto list = std::static_pointer_cast<arrow::ListArray>(chunk);
        if (list->length() == 0) continue;
        for (int64_t i = 0; i < list->length(); ++i) {
            if (list->IsNull(i)) continue;
            for (int64_t j = list->value_offset(i); j < list->value_offset(i + 1); ++j) {
                parent.push_back(row_base + i);
                child.push_back(child_base + j - list->value_offset(0));
            }
        }
        // Flatten() would drop the slice offset; slice the values ourselves
        auto values = list->values()->Slice(list->value_offset(0),
                                            list->value_offset(list->length()) - list->value_offset(0));
        child_chunks.push_back(values);
        row_base += list->length();
        child_base += values->length();
    }

    const auto parent_idx = toInt64Array(parent);
    auto all_children = std::make_shared<arrow::ChunkedArray>(child_chunks, value_type);

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::ChunkedArray>> columns;
    for (int i = 0; i < table->num_columns(); ++i) {
        if (i == idx) {
            fields.push_back(arrow::field(field->name(), value_type));
            columns.push_back(takeColumn(all_children, toInt64Array(child)));
        } else {
            fields.push_back(table->schema()->field(i));
            columns.push_back(takeColumn(table->column(i), parent_idx));
        }
    }
    return arrow::Table::Make(arrow::schema(fields, table->schema()->metadata()), columns,
                              static_cast<int64_t>(parent.size()));
}

TablePtr innerJoin(const TablePtr& left, const TablePtr& right,
                   const std::string& left_key, const std::string& right_key,
                   const JoinOptions& options) {
    ensureComputeKernels();
    const int lk = requireColumn(left, left_key);
    const int rk = requireColumn(right, right_key);
    const auto lkeys = keyStrings(left, lk);
    const auto rkeys = keyStrings(right, rk);

    std::unordered_map<std::string, std::vector<int64_t>> index;
    index.reserve(static_cast<size_t>(rkeys->length()));
    for (int64_t j = 0; j < rkeys->length(); ++j) {
        if (rkeys->IsNull(j)) continue;
        index[rkeys->GetString(j)].push_back(j);
    }

    std::vector<int64_t> left_rows;
    std::vector<int64_t> right_rows;
    for (int64_t i = 0; i < lkeys->length(); ++i) {
        if (lkeys->IsNull(i)) continue;
        auto it = index.find(lkeys->GetString(i));
        if (it == index.end()) continue;
        for (int64_t j : it->second) {
            left_rows.push_back(i);
            right_rows.push_back(j);
        }
    }

    const auto left_idx = toInt64Array(left_rows);
    const auto right_idx = toInt64Array(right_rows);

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::ChunkedArray>> columns;
    std::unordered_set<std::string> names;
    for (int i = 0; i < left->num_columns(); ++i) {
        fields.push_back(left->schema()->field(i));
        names.insert(left->schema()->field(i)->name());
        columns.push_back(takeColumn(left->column(i), left_idx));
    }
    for (int i = 0; i < right->num_columns(); ++i) {
        if (i == rk && !options.keep_right_key) continue;
        auto f = right->schema()->field(i);
        if (names.count(f->name())) {
            f = f->WithName(f->name() + options.right_suffix);
        }
        names.insert(f->name());
        fields.push_back(f);
        columns.push_back(takeColumn(right->column(i), right_idx));
    }
    return arrow::Table::Make(arrow::schema(fields), columns, static_cast<int64_t>(left_rows.size()));
}

TablePtr filter(const TablePtr& table, const arrow::compute::Expression& predicate) {
    ensureComputeKernels();
    auto bound = valueOrThrow(predicate.Bind(*table->schema()), "bind predicate");
    auto batch = valueOrThrow(table->CombineChunksToBatch(), "combine chunks");

    cp::ExecContext ctx;
    arrow::Datum mask = valueOrThrow(cp::ExecuteScalarExpression(bound, cp::ExecBatch(*batch), &ctx),
                                     "evaluate predicate");
    if (mask.is_scalar()) {
        auto arr = valueOrThrow(arrow::MakeArrayFromScalar(*mask.scalar(), batch->num_rows()),
                                "broadcast predicate");
        mask = arrow::Datum(arr);
    }
    arrow::Datum filtered = valueOrThrow(cp::Filter(batch, mask), "filter rows");
    return valueOrThrow(arrow::Table::FromRecordBatches(table->schema(), {filtered.record_batch()}),
                        "filter result");
}

TablePtr moveColumnFirst(const TablePtr& table, const std::string& column) {
    const int idx = requireColumn(table, column);
    if (idx == 0) return table;
    auto field = table->schema()->field(idx);
    auto data = table->column(idx);
    auto without = valueOrThrow(table->RemoveColumn(idx), "remove column");
    return valueOrThrow(without->AddColumn(0, field, data), "add column");
}

TablePtr selectColumns(const TablePtr& table, const std::vector<std::string>& columns) {
    std::vector<int> indices;
    indices.reserve(columns.size());
    for (const auto& c : columns) {
        indices.push_back(requireColumn(table, c));
    }
    return valueOrThrow(table->SelectColumns(indices), "select columns");
}

TablePtr emptyLike(const TablePtr& table) {
    return table->Slice(0, 0);
}

std::vector<std::string> stringValues(const TablePtr& table, const std::string& column) {
    const int idx = requireColumn(table, column);
    const auto strings = keyStrings(table, idx);
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(strings->length()));
    for (int64_t i = 0; i < strings->length(); ++i) {
        out.push_back(strings->IsNull(i) ? std::string() : strings->GetString(i));
    }
    return out;
}

} // namespace storage
} // namespace statlas
