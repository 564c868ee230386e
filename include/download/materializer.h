#pragma once

#include "download/column_reader.h"
#include "download/metric_request.h"
#include "geo/region_spec.h"
#include "io/http_client.h"
#include "query/search_params.h"

#include <arrow/api.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace statlas {
namespace download {

struct DownloadParams {
    bool include_geoms = true;
    std::vector<geo::RegionSpec> region_spec;  // at most one is supported
};

/// Everything needed to go from facets to a materialized table
struct Params {
    query::SearchParams search;
    DownloadParams download;
};

/**
 * @brief Turns metric requests into one table of metric values joined to geometry
 *
 * Metric columns and geometries are fetched concurrently; the join waits for
 * both and any failure aborts the whole download.
 */
class Materializer {
public:
    explicit Materializer(io::HttpClient client = io::HttpClient());

    /**
     * @brief Columns GEO_ID, geometry, metric columns (geometry only with include_geoms)
     *
     * Rows whose GEO_ID is missing on either side are dropped; no overlap
     * yields an empty table.
     * @throws ShapeError for no requests, UnsupportedError for several
     * geometry files or region specs, ResourceError on fetch failure
     */
    std::shared_ptr<arrow::Table> download(const std::vector<MetricRequest>& requests,
                                           const DownloadParams& params) const;

    /**
     * @brief The one geometry file all requests share
     * @throws ShapeError if there is none, UnsupportedError if there are several
     */
    static std::string singleGeometryFile(const std::vector<MetricRequest>& requests);

    /**
     * @brief Bounding box of the (single) region spec, if any
     * @throws UnsupportedError for more than one region spec
     */
    static std::optional<geo::BBox> regionBBox(const DownloadParams& params);

private:
    io::HttpClient client_;
};

} // namespace download
} // namespace statlas
