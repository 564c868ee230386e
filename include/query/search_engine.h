#pragma once

#include "catalog/metadata_catalog.h"
#include "download/metric_request.h"
#include "query/search_params.h"
#include "utils/config.h"

#include <arrow/api.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace statlas {
namespace query {

/**
 * @brief Catalog view rows matched by a search
 */
class SearchResults {
public:
    explicit SearchResults(std::shared_ptr<arrow::Table> table);

    const std::shared_ptr<arrow::Table>& table() const { return table_; }
    int64_t numRows() const { return table_->num_rows(); }
    bool empty() const { return numRows() == 0; }

    /**
     * @brief One request per row
     *
     * metric_file = base_path/metric_parquet_path,
     * geom_file = base_path/geometry_filepath_stem.fgb
     */
    std::vector<download::MetricRequest> toMetricRequests(const Config& config) const;

    /// Distinct geometry levels with their row counts, most frequent first
    std::vector<std::pair<std::string, int64_t>> availableGeometryLevels() const;

    /// Key columns only, renamed to their display labels
    std::shared_ptr<arrow::Table> summary() const;

private:
    std::shared_ptr<arrow::Table> table_;
};

/**
 * @brief Apply the compiled predicate to the catalog view
 *
 * With no facets every view row is returned unchanged.
 * @throws ValidationError if the predicate cannot be compiled
 */
SearchResults search(const SearchParams& params, const catalog::DenormalizedView& view);

} // namespace query
} // namespace statlas
