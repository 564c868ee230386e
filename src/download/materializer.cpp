#include "download/materializer.h"
#include "catalog/column_names.h"
#include "geo/geometry_reader.h"
#include "storage/table_ops.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <fmt/ranges.h>
#include <tbb/task_group.h>

#include <algorithm>

namespace statlas {
namespace download {

Materializer::Materializer(io::HttpClient client) : client_(std::move(client)) {}

std::string Materializer::singleGeometryFile(const std::vector<MetricRequest>& requests) {
    std::vector<std::string> files;
    for (const auto& r : requests) {
        if (std::find(files.begin(), files.end(), r.geom_file) == files.end()) {
            files.push_back(r.geom_file);
        }
    }
    if (files.empty()) {
        throw ShapeError("no geometry files for the requested metrics");
    }
    if (files.size() > 1) {
        STATLAS_ERROR("Multiple geometries not supported in current release: {}", fmt::join(files, ", "));
        throw UnsupportedError("multiple geometry files in one request (" + std::to_string(files.size()) +
                               "); narrow the search to one geometry level and country");
    }
    return files.front();
}

std::optional<geo::BBox> Materializer::regionBBox(const DownloadParams& params) {
    if (params.region_spec.size() > 1) {
        throw UnsupportedError("multiple region specifications (" + std::to_string(params.region_spec.size()) + ")");
    }
    if (params.region_spec.empty()) {
        return std::nullopt;
    }
    const auto& region = params.region_spec.front();
    auto bbox = geo::bboxOf(region);
    if (!bbox) {
        STATLAS_WARN("Region {} is not supported yet and is ignored", geo::describe(region));
    }
    return bbox;
}

std::shared_ptr<arrow::Table> Materializer::download(const std::vector<MetricRequest>& requests,
                                                     const DownloadParams& params) const {
    if (requests.empty()) {
        throw ShapeError("no metric requests were derived from the search results");
    }
    const std::string geom_file = singleGeometryFile(requests);

    if (!params.include_geoms) {
        return fetchMetrics(requests, std::nullopt, client_);
    }

    const auto bbox = regionBBox(params);
    if (bbox) {
        STATLAS_WARN("The bounding box should be in the same coordinate reference system as {}", geom_file);
    }

    std::shared_ptr<arrow::Table> metrics;
    std::shared_ptr<arrow::Table> geoms;
    tbb::task_group tg;
    tg.run([&]() { metrics = fetchMetrics(requests, std::nullopt, client_); });
    tg.run([&]() { geoms = geo::fetchGeometries(geom_file, bbox); });
    tg.wait();

    STATLAS_DEBUG("Joining {} geometries with {} metric rows", geoms->num_rows(), metrics->num_rows());
    return storage::innerJoin(geoms, metrics, col::GEO_ID, col::GEO_ID);
}

} // namespace download
} // namespace statlas
