#pragma once

#include "download/metric_request.h"
#include "io/http_client.h"

#include <arrow/api.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace statlas {
namespace download {

using KeySet = std::vector<std::string>;

/**
 * @brief Read the requested columns plus GEO_ID from one Parquet file
 *
 * Result columns: the requested ones in order, then GEO_ID. With a key set,
 * only rows whose GEO_ID is in it are kept.
 * @throws ResourceError if the file cannot be read or a column is missing
 */
std::shared_ptr<arrow::Table> fetchColumns(const std::string& url, const std::vector<std::string>& columns,
                                           const std::optional<KeySet>& keys = std::nullopt,
                                           const io::HttpClient& client = io::HttpClient());

/**
 * @brief Fetch every requested column, one concurrent read per distinct file
 *
 * Per-file tables are inner-joined on GEO_ID in first-appearance order of the
 * files; GEO_ID ends up as the first column.
 * @throws ShapeError for an empty request list, ResourceError on fetch failure
 */
std::shared_ptr<arrow::Table> fetchMetrics(const std::vector<MetricRequest>& requests,
                                           const std::optional<KeySet>& keys = std::nullopt,
                                           const io::HttpClient& client = io::HttpClient());

/// Distinct metric files with their columns, in first-appearance order
std::vector<std::pair<std::string, std::vector<std::string>>> groupByFile(
    const std::vector<MetricRequest>& requests);

/**
 * @brief SQL text equivalent of fetchMetrics, for engines with read_parquet()
 *
 * Deterministic: files are numbered q0, q1, ... in first-appearance order.
 * @throws ShapeError for an empty request list
 */
std::string toSqlText(const std::vector<MetricRequest>& requests, const std::optional<KeySet>& keys = std::nullopt);

} // namespace download
} // namespace statlas
