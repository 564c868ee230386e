#pragma once

#include "geo/region_spec.h"

#include <arrow/api.h>

#include <memory>
#include <optional>
#include <string>

namespace statlas {
namespace geo {

/**
 * @brief Read the features of one FlatGeobuf file as (GEO_ID, geometry WKT)
 *
 * http(s) URLs are streamed through GDAL's /vsicurl/ handler, which issues
 * range requests against the file's spatial index; file:// URLs and plain
 * paths are opened locally. With a bounding box only intersecting features
 * are returned.
 *
 * @throws ResourceError if the file cannot be opened or a feature has no GEO_ID
 */
std::shared_ptr<arrow::Table> fetchGeometries(const std::string& url, const std::optional<BBox>& bbox = std::nullopt);

/// Name GDAL is given for a location ("/vsicurl/https://..." or a local path)
std::string gdalPath(const std::string& url);

} // namespace geo
} // namespace statlas
