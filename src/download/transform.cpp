#include "download/transform.h"
#include "storage/table_ops.h"
#include "utils/arrow_status.h"
#include "utils/errors.h"

namespace statlas {
namespace download {

namespace {

struct TransformVisitor {
    const std::shared_ptr<arrow::Table>& table;

    std::shared_ptr<arrow::Table> operator()(const RenameColumnTransform& t) const {
        auto names = table->ColumnNames();
        bool found = false;
        for (auto& n : names) {
            if (n == t.from) {
                n = t.to;
                found = true;
            }
        }
        if (!found) {
            throw ValidationError("cannot rename missing column '" + t.from + "'");
        }
        return utils::valueOrThrow(table->RenameColumns(names), "rename column");
    }

    std::shared_ptr<arrow::Table> operator()(const SelectColumnsTransform& t) const {
        return storage::selectColumns(table, t.columns);
    }
};

} // namespace

std::shared_ptr<arrow::Table> applyTransform(const Transform& transform, const std::shared_ptr<arrow::Table>& table) {
    return std::visit(TransformVisitor{table}, transform);
}

std::shared_ptr<arrow::Table> applyTransforms(const std::vector<Transform>& transforms,
                                              std::shared_ptr<arrow::Table> table) {
    for (const auto& t : transforms) {
        table = applyTransform(t, table);
    }
    return table;
}

} // namespace download
} // namespace statlas
