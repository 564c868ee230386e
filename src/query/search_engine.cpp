#include "query/search_engine.h"
#include "catalog/column_names.h"
#include "io/http_client.h"
#include "query/predicate_compiler.h"
#include "storage/table_ops.h"
#include "utils/arrow_status.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <arrow/compute/api.h>

#include <algorithm>

namespace statlas {
namespace query {

using utils::valueOrThrow;

SearchResults::SearchResults(std::shared_ptr<arrow::Table> table) : table_(std::move(table)) {
    if (!table_) {
        throw StatlasError("SearchResults needs a table");
    }
}

std::vector<download::MetricRequest> SearchResults::toMetricRequests(const Config& config) const {
    const auto columns = storage::stringValues(table_, col::METRIC_PARQUET_COLUMN_NAME);
    const auto paths = storage::stringValues(table_, col::METRIC_PARQUET_PATH);
    const auto stems = storage::stringValues(table_, col::GEOMETRY_FILEPATH_STEM);

    std::vector<download::MetricRequest> requests;
    requests.reserve(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) {
        requests.push_back(download::MetricRequest{
            columns[i],
            io::joinPath(config.base_path, paths[i]),
            io::joinPath(config.base_path, stems[i] + ".fgb"),
        });
    }
    return requests;
}

std::vector<std::pair<std::string, int64_t>> SearchResults::availableGeometryLevels() const {
    std::vector<std::pair<std::string, int64_t>> levels;
    for (const auto& level : storage::stringValues(table_, col::GEOMETRY_LEVEL)) {
        auto it = std::find_if(levels.begin(), levels.end(),
                               [&level](const auto& l) { return l.first == level; });
        if (it == levels.end()) {
            levels.emplace_back(level, 1);
        } else {
            ++it->second;
        }
    }
    std::stable_sort(levels.begin(), levels.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return levels;
}

std::shared_ptr<arrow::Table> SearchResults::summary() const {
    static const char* const kColumns[] = {
        col::METRIC_ID,
        col::METRIC_HUMAN_READABLE_NAME,
        col::METRIC_DESCRIPTION,
        col::METRIC_HXL_TAG,
        col::SOURCE_DATA_RELEASE_COLLECTION_PERIOD_START,
        col::COUNTRY_NAME_SHORT_EN,
        col::GEOMETRY_LEVEL,
        col::METRIC_SOURCE_DOWNLOAD_URL,
    };
    const auto& labels = col::displayLabels();
    std::vector<std::string> present;
    std::vector<std::string> renamed;
    for (const char* c : kColumns) {
        if (table_->schema()->GetFieldIndex(c) < 0) continue;
        present.emplace_back(c);
        auto it = labels.find(c);
        renamed.push_back(it != labels.end() ? it->second : std::string(c));
    }
    auto selected = storage::selectColumns(table_, present);
    return valueOrThrow(selected->RenameColumns(renamed), "rename summary columns");
}

SearchResults search(const SearchParams& params, const catalog::DenormalizedView& view) {
    auto predicate = PredicateCompiler::compile(params);
    const auto& table = view.table();
    if (!predicate) {
        return SearchResults(table);
    }
    STATLAS_DEBUG("Search predicate: {}", predicate->ToString());
    auto matched = storage::filter(table, *predicate);
    STATLAS_DEBUG("Search matched {} of {} rows", matched->num_rows(), table->num_rows());
    return SearchResults(matched);
}

} // namespace query
} // namespace statlas
