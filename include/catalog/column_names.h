#pragma once

#include <string>
#include <unordered_map>

// Column names of the five catalog relations. They must stay in sync with the
// names written by the metadata publishing pipeline.
namespace statlas {
namespace col {

inline constexpr const char* GEO_ID = "GEO_ID";
inline constexpr const char* GEOMETRY = "geometry";

inline constexpr const char* COUNTRY_ID = "country_id";
inline constexpr const char* COUNTRY_NAME_SHORT_EN = "country_name_short_en";
inline constexpr const char* COUNTRY_NAME_OFFICIAL = "country_name_official";
inline constexpr const char* COUNTRY_ISO3 = "country_iso3";
inline constexpr const char* COUNTRY_ISO2 = "country_iso2";
inline constexpr const char* COUNTRY_ISO3166_2 = "country_iso3166_2";

inline constexpr const char* DATA_PUBLISHER_ID = "data_publisher_id";
inline constexpr const char* DATA_PUBLISHER_NAME = "data_publisher_name";
inline constexpr const char* DATA_PUBLISHER_URL = "data_publisher_url";
inline constexpr const char* DATA_PUBLISHER_DESCRIPTION = "data_publisher_description";
inline constexpr const char* DATA_PUBLISHER_COUNTRIES_OF_INTEREST = "data_publisher_countries_of_interest";

inline constexpr const char* GEOMETRY_ID = "geometry_id";
inline constexpr const char* GEOMETRY_FILEPATH_STEM = "geometry_filepath_stem";
inline constexpr const char* GEOMETRY_VALIDITY_PERIOD_START = "geometry_validity_period_start";
inline constexpr const char* GEOMETRY_VALIDITY_PERIOD_END = "geometry_validity_period_end";
inline constexpr const char* GEOMETRY_LEVEL = "geometry_level";
inline constexpr const char* GEOMETRY_HXL_TAG = "geometry_hxl_tag";

inline constexpr const char* SOURCE_DATA_RELEASE_ID = "source_data_release_id";
inline constexpr const char* SOURCE_DATA_RELEASE_NAME = "source_data_release_name";
inline constexpr const char* SOURCE_DATA_RELEASE_DATE_PUBLISHED = "source_data_release_date_published";
inline constexpr const char* SOURCE_DATA_RELEASE_REFERENCE_PERIOD_START = "source_data_release_reference_period_start";
inline constexpr const char* SOURCE_DATA_RELEASE_REFERENCE_PERIOD_END = "source_data_release_reference_period_end";
inline constexpr const char* SOURCE_DATA_RELEASE_COLLECTION_PERIOD_START = "source_data_release_collection_period_start";
inline constexpr const char* SOURCE_DATA_RELEASE_COLLECTION_PERIOD_END = "source_data_release_collection_period_end";
inline constexpr const char* SOURCE_DATA_RELEASE_EXPECT_NEXT_UPDATE = "source_data_release_expect_next_update";
inline constexpr const char* SOURCE_DATA_RELEASE_URL = "source_data_release_url";
inline constexpr const char* SOURCE_DATA_RELEASE_DATA_PUBLISHER_ID = "source_data_release_data_publisher_id";
inline constexpr const char* SOURCE_DATA_RELEASE_DESCRIPTION = "source_data_release_description";
inline constexpr const char* SOURCE_DATA_RELEASE_GEOMETRY_METADATA_ID = "source_data_release_geometry_metadata_id";

inline constexpr const char* METRIC_ID = "metric_id";
inline constexpr const char* METRIC_HUMAN_READABLE_NAME = "metric_human_readable_name";
inline constexpr const char* METRIC_SOURCE_METRIC_ID = "metric_source_id";
inline constexpr const char* METRIC_DESCRIPTION = "metric_description";
inline constexpr const char* METRIC_HXL_TAG = "metric_hxl_tag";
inline constexpr const char* METRIC_PARQUET_PATH = "metric_parquet_path";
inline constexpr const char* METRIC_PARQUET_COLUMN_NAME = "metric_parquet_column_name";
inline constexpr const char* METRIC_PARQUET_MARGIN_OF_ERROR_COLUMN = "metric_parquet_margin_of_error_column";
inline constexpr const char* METRIC_PARQUET_MARGIN_OF_ERROR_FILE = "metric_parquet_margin_of_error_file";
inline constexpr const char* METRIC_POTENTIAL_DENOMINATOR_IDS = "metric_potential_denominator_ids";
inline constexpr const char* METRIC_PARENT_METRIC_ID = "metric_parent_metric_id";
inline constexpr const char* METRIC_SOURCE_DATA_RELEASE_ID = "metric_source_data_release_id";
inline constexpr const char* METRIC_SOURCE_DOWNLOAD_URL = "metric_source_download_url";
inline constexpr const char* METRIC_SOURCE_ARCHIVE_FILE_PATH = "metric_source_archive_file_path";
inline constexpr const char* METRIC_SOURCE_DOCUMENTATION_URL = "metric_source_documentation_url";

/**
 * @brief Column name -> human readable label for result summaries
 *
 * Built on first use and never modified afterwards.
 */
const std::unordered_map<std::string, std::string>& displayLabels();

} // namespace col
} // namespace statlas
