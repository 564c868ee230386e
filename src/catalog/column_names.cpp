#include "catalog/column_names.h"

namespace statlas {
namespace col {

const std::unordered_map<std::string, std::string>& displayLabels() {
    // Function-local static: initialized exactly once, thread-safe since C++11
    static const std::unordered_map<std::string, std::string> labels = {
        {COUNTRY_ID, "Country ID"},
        {COUNTRY_NAME_OFFICIAL, "Country Name (official)"},
        {COUNTRY_NAME_SHORT_EN, "Country"},
        {COUNTRY_ISO3, "ISO3166-1 alpha-3"},
        {COUNTRY_ISO2, "ISO3166-1 alpha-2"},
        {METRIC_ID, "Metric ID"},
        {METRIC_HUMAN_READABLE_NAME, "Human readable name"},
        {METRIC_DESCRIPTION, "Description"},
        {METRIC_HXL_TAG, "HXL tag"},
        {SOURCE_DATA_RELEASE_COLLECTION_PERIOD_START, "Collection date"},
        {GEOMETRY_LEVEL, "Geometry level"},
        {METRIC_SOURCE_DOWNLOAD_URL, "Source download URL"},
    };
    return labels;
}

} // namespace col
} // namespace statlas
