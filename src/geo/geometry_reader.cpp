#include "geo/geometry_reader.h"
#include "catalog/column_names.h"
#include "io/http_client.h"
#include "utils/arrow_status.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>

#include <mutex>

namespace statlas {
namespace geo {

using utils::throwIfError;
using utils::valueOrThrow;

namespace {

std::once_flag g_gdal_init;

void ensureGdalRegistered() {
    std::call_once(g_gdal_init, []() { GDALAllRegister(); });
}

} // namespace

std::string gdalPath(const std::string& url) {
    if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
        return "/vsicurl/" + url;
    }
    return io::stripFileScheme(url);
}

std::shared_ptr<arrow::Table> fetchGeometries(const std::string& url, const std::optional<BBox>& bbox) {
    ensureGdalRegistered();
    const std::string path = gdalPath(url);
    STATLAS_DEBUG("Fetching geometries from {}", path);

    GDALDatasetUniquePtr ds(GDALDataset::Open(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                              nullptr, nullptr, nullptr));
    if (!ds) {
        throw ResourceError("cannot open geometry file '" + url + "': " + CPLGetLastErrorMsg());
    }
    if (ds->GetLayerCount() < 1) {
        throw ResourceError("geometry file '" + url + "' has no layer");
    }
    OGRLayer* layer = ds->GetLayer(0);
    const int key_idx = layer->GetLayerDefn()->GetFieldIndex(col::GEO_ID);
    if (key_idx < 0) {
        throw ResourceError(std::string("geometry file '") + url + "' has no " + col::GEO_ID + " property");
    }

    if (bbox) {
        layer->SetSpatialFilterRect(bbox->minX(), bbox->minY(), bbox->maxX(), bbox->maxY());
    }
    layer->ResetReading();

    arrow::StringBuilder ids;
    arrow::StringBuilder geoms;
    for (const auto& feature : *layer) {
        if (!feature->IsFieldSetAndNotNull(key_idx)) {
            throw ResourceError("feature " + std::to_string(feature->GetFID()) + " in '" + url +
                                "' has no " + col::GEO_ID);
        }
        throwIfError(ids.Append(feature->GetFieldAsString(key_idx)), "append GEO_ID");
        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (geometry) {
            throwIfError(geoms.Append(geometry->exportToWkt()), "append geometry");
        } else {
            throwIfError(geoms.AppendNull(), "append geometry");
        }
    }

    auto id_array = valueOrThrow(ids.Finish(), "finish GEO_ID");
    auto geom_array = valueOrThrow(geoms.Finish(), "finish geometry");
    auto schema = arrow::schema({arrow::field(col::GEO_ID, arrow::utf8()),
                                 arrow::field(col::GEOMETRY, arrow::utf8())});
    STATLAS_DEBUG("Read {} features from {}", id_array->length(), url);
    return arrow::Table::Make(schema, {id_array, geom_array});
}

} // namespace geo
} // namespace statlas
