#include "catalog/metadata_catalog.h"
#include "catalog/column_names.h"
#include "io/parquet_io.h"
#include "storage/table_ops.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include "utils/string_utils.h"

#include <fmt/ranges.h>
#include <tbb/task_group.h>

namespace statlas {
namespace catalog {

std::vector<std::pair<std::string, TablePtr>> Catalog::relations() const {
    return {
        {CatalogFiles::METRICS, metrics},
        {CatalogFiles::GEOMETRIES, geometries},
        {CatalogFiles::SOURCE_DATA_RELEASES, source_data_releases},
        {CatalogFiles::DATA_PUBLISHERS, data_publishers},
        {CatalogFiles::COUNTRIES, countries},
    };
}

bool Catalog::equals(const Catalog& other) const {
    const auto mine = relations();
    const auto theirs = other.relations();
    for (size_t i = 0; i < mine.size(); ++i) {
        const auto& a = mine[i].second;
        const auto& b = theirs[i].second;
        if (!a || !b) {
            if (a != b) return false;
            continue;
        }
        if (!a->Equals(*b)) return false;
    }
    return true;
}

CountryMetadataLoader::CountryMetadataLoader(std::string country, io::HttpClient client)
    : country_(std::move(country)), client_(std::move(client)) {}

TablePtr CountryMetadataLoader::loadRelation(const Config& config, const char* file) const {
    const std::string location = io::joinPath(io::joinPath(config.base_path, country_), file);
    STATLAS_DEBUG("Loading {} for {} from {}", file, country_, location);
    return io::readParquet(location, std::nullopt, client_);
}

Catalog CountryMetadataLoader::load(const Config& config) const {
    Catalog c;
    tbb::task_group tg;
    tg.run([&]() { c.metrics = loadRelation(config, CatalogFiles::METRICS); });
    tg.run([&]() { c.geometries = loadRelation(config, CatalogFiles::GEOMETRIES); });
    tg.run([&]() { c.source_data_releases = loadRelation(config, CatalogFiles::SOURCE_DATA_RELEASES); });
    tg.run([&]() { c.data_publishers = loadRelation(config, CatalogFiles::DATA_PUBLISHERS); });
    tg.run([&]() { c.countries = loadRelation(config, CatalogFiles::COUNTRIES); });
    // Rethrows the first failure; the other fetches are cancelled
    tg.wait();
    return c;
}

std::vector<std::string> countryNames(const Config& config, const io::HttpClient& client) {
    const std::string location = io::joinPath(config.base_path, CatalogFiles::COUNTRY_LIST);
    return utils::splitNonEmptyLines(io::readText(location, client));
}

Catalog loadAll(const Config& config, const io::HttpClient& client) {
    const auto names = countryNames(config, client);
    STATLAS_INFO("Detected {} countries: {}", names.size(), fmt::join(names, ", "));
    if (names.empty()) {
        throw ResourceError("country list at '" + config.base_path + "' is empty");
    }

    std::vector<Catalog> per_country(names.size());
    tbb::task_group tg;
    for (size_t i = 0; i < names.size(); ++i) {
        tg.run([&, i]() {
            per_country[i] = CountryMetadataLoader(names[i], client).load(config);
        });
    }
    tg.wait();

    auto unionOf = [&per_country](TablePtr Catalog::*member, const char* what) {
        std::vector<TablePtr> parts;
        parts.reserve(per_country.size());
        for (const auto& c : per_country) {
            parts.push_back(c.*member);
        }
        auto merged = storage::concatUnified(parts);
        STATLAS_INFO("Merged {} with shape: ({}, {})", what, merged->num_rows(), merged->num_columns());
        return merged;
    };

    Catalog merged;
    merged.metrics = unionOf(&Catalog::metrics, "metrics");
    merged.geometries = unionOf(&Catalog::geometries, "geometries");
    merged.source_data_releases = unionOf(&Catalog::source_data_releases, "source data releases");
    merged.data_publishers = unionOf(&Catalog::data_publishers, "data publishers");
    merged.countries = unionOf(&Catalog::countries, "countries");
    return merged;
}

TablePtr joinCatalog(const Catalog& catalog) {
    using storage::innerJoin;
    auto t = innerJoin(catalog.metrics, catalog.source_data_releases,
                       col::METRIC_SOURCE_DATA_RELEASE_ID, col::SOURCE_DATA_RELEASE_ID);
    t = innerJoin(t, catalog.geometries, col::SOURCE_DATA_RELEASE_GEOMETRY_METADATA_ID, col::GEOMETRY_ID);
    t = innerJoin(t, catalog.data_publishers, col::SOURCE_DATA_RELEASE_DATA_PUBLISHER_ID, col::DATA_PUBLISHER_ID);
    t = storage::explodeList(t, col::DATA_PUBLISHER_COUNTRIES_OF_INTEREST);
    t = innerJoin(t, catalog.countries, col::DATA_PUBLISHER_COUNTRIES_OF_INTEREST, col::COUNTRY_ID);
    STATLAS_DEBUG("Column names in merged metadata: {}", fmt::join(t->schema()->field_names(), ", "));
    return t;
}

DenormalizedView::DenormalizedView(std::shared_ptr<const Catalog> catalog)
    : catalog_(std::move(catalog)) {
    if (!catalog_) {
        throw StatlasError("DenormalizedView needs a catalog");
    }
}

const TablePtr& DenormalizedView::table() const {
    std::call_once(once_, [this]() {
        table_ = joinCatalog(*catalog_);
        materialized_ = true;
    });
    return table_;
}

std::shared_ptr<DenormalizedView> combinedView(std::shared_ptr<const Catalog> catalog) {
    return std::make_shared<DenormalizedView>(std::move(catalog));
}

} // namespace catalog
} // namespace statlas
