#pragma once

#include "api/data_request_spec.h"
#include "catalog/metadata_catalog.h"
#include "download/column_reader.h"
#include "download/materializer.h"
#include "io/http_client.h"
#include "query/search_engine.h"
#include "query/search_params.h"
#include "utils/config.h"

#include <arrow/api.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace statlas {

/**
 * @brief Entry point used by front ends: owns the configuration and the loaded catalog
 *
 * Safe to share between threads once constructed; the catalog is read-only
 * and the joined view is built once on the first search.
 */
class Statlas {
public:
    Statlas(Config config, catalog::Catalog catalog, io::HttpClient client = io::HttpClient());

    /// Load the catalog from config.base_path
    static Statlas create(Config config, io::HttpClient client = io::HttpClient());

    /// Like create(), going through the catalog cache in config.cache_dir
    static Statlas createWithCache(Config config, io::HttpClient client = io::HttpClient());

    query::SearchResults search(const query::SearchParams& params) const;

    std::shared_ptr<arrow::Table> download(const query::SearchResults& results,
                                           const download::DownloadParams& params) const;

    /// search() then download()
    std::shared_ptr<arrow::Table> downloadParams(const download::Params& params) const;

    std::shared_ptr<arrow::Table> downloadDataRequestSpec(const api::DataRequestSpec& spec) const;

    std::vector<download::MetricRequest> metricRequests(const query::SearchResults& results) const;

    std::string sqlText(const query::SearchResults& results,
                        const std::optional<download::KeySet>& keys = std::nullopt) const;

    /// Country relation of the catalog
    std::shared_ptr<arrow::Table> countries() const;

    const Config& config() const { return config_; }
    const catalog::Catalog& catalog() const { return *catalog_; }

private:
    Config config_;
    std::shared_ptr<const catalog::Catalog> catalog_;
    std::shared_ptr<catalog::DenormalizedView> view_;
    download::Materializer materializer_;
};

} // namespace statlas
