#pragma once

#include "io/http_client.h"
#include "utils/config.h"

#include <arrow/api.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace statlas {
namespace catalog {

using TablePtr = std::shared_ptr<arrow::Table>;

/// Per-relation file names, identical remotely ({base}/{country}/...) and in the cache directory
struct CatalogFiles {
    static constexpr const char* METRICS = "metric_metadata.parquet";
    static constexpr const char* GEOMETRIES = "geometry_metadata.parquet";
    static constexpr const char* SOURCE_DATA_RELEASES = "source_metadata.parquet";
    static constexpr const char* DATA_PUBLISHERS = "publisher_metadata.parquet";
    static constexpr const char* COUNTRIES = "country_metadata.parquet";
    static constexpr const char* COUNTRY_LIST = "countries.txt";
};

/**
 * @brief The five metadata relations, immutable once loaded
 */
struct Catalog {
    TablePtr metrics;
    TablePtr geometries;
    TablePtr source_data_releases;
    TablePtr data_publishers;
    TablePtr countries;

    /// Relation tables paired with their file names, in a fixed order
    std::vector<std::pair<std::string, TablePtr>> relations() const;

    /// Same schemas and same values in every relation
    bool equals(const Catalog& other) const;
};

/**
 * @brief Loads the five relations of one country, all fetches in flight at once
 */
class CountryMetadataLoader {
public:
    explicit CountryMetadataLoader(std::string country, io::HttpClient client = io::HttpClient());

    /// @throws ResourceError if any of the five fetches fails
    Catalog load(const Config& config) const;

    const std::string& country() const { return country_; }

private:
    TablePtr loadRelation(const Config& config, const char* file) const;

    std::string country_;
    io::HttpClient client_;
};

/**
 * @brief Country ids listed in {base}/countries.txt (blank lines skipped)
 * @throws ResourceError
 */
std::vector<std::string> countryNames(const Config& config, const io::HttpClient& client = io::HttpClient());

/**
 * @brief Load every listed country concurrently and union each relation
 *
 * Rows appear in country-list order regardless of completion order. Columns
 * that differ between countries are widened or null-filled.
 * @throws ResourceError if the list or any country fails to load
 */
Catalog loadAll(const Config& config, const io::HttpClient& client = io::HttpClient());

/**
 * @brief Metric -> release -> geometry -> publisher -> country join, built on first use
 *
 * One row per (metric, country of interest) pair. Metrics lacking any link
 * in the chain are absent. The join runs at most once even with concurrent
 * callers; a failed attempt is retried by the next call.
 */
class DenormalizedView {
public:
    explicit DenormalizedView(std::shared_ptr<const Catalog> catalog);

    DenormalizedView(const DenormalizedView&) = delete;
    DenormalizedView& operator=(const DenormalizedView&) = delete;

    /// Forces the join on first call
    const TablePtr& table() const;

    bool materialized() const { return materialized_.load(); }

    const Catalog& catalog() const { return *catalog_; }

private:
    std::shared_ptr<const Catalog> catalog_;
    mutable std::once_flag once_;
    mutable TablePtr table_;
    mutable std::atomic<bool> materialized_{false};
};

/// Eagerly joined table; DenormalizedView calls this lazily
TablePtr joinCatalog(const Catalog& catalog);

std::shared_ptr<DenormalizedView> combinedView(std::shared_ptr<const Catalog> catalog);

} // namespace catalog
} // namespace statlas
