#include "api/statlas.h"
#include "catalog/catalog_cache.h"
#include "utils/logger.h"

namespace statlas {

Statlas::Statlas(Config config, catalog::Catalog catalog, io::HttpClient client)
    : config_(std::move(config)),
      catalog_(std::make_shared<const catalog::Catalog>(std::move(catalog))),
      view_(catalog::combinedView(catalog_)),
      materializer_(std::move(client)) {}

Statlas Statlas::create(Config config, io::HttpClient client) {
    utils::Logger::init(config.log_file, config.log_level);
    STATLAS_DEBUG("Config: {}", config.toJson().dump());
    auto loaded = catalog::loadAll(config, client);
    return Statlas(std::move(config), std::move(loaded), std::move(client));
}

Statlas Statlas::createWithCache(Config config, io::HttpClient client) {
    utils::Logger::init(config.log_file, config.log_level);
    STATLAS_DEBUG("Config: {}", config.toJson().dump());
    auto loaded = catalog::loadWithCache(config, client);
    return Statlas(std::move(config), std::move(loaded), std::move(client));
}

query::SearchResults Statlas::search(const query::SearchParams& params) const {
    return query::search(params, *view_);
}

std::shared_ptr<arrow::Table> Statlas::download(const query::SearchResults& results,
                                                const download::DownloadParams& params) const {
    return materializer_.download(results.toMetricRequests(config_), params);
}

std::shared_ptr<arrow::Table> Statlas::downloadParams(const download::Params& params) const {
    return download(search(params.search), params.download);
}

std::shared_ptr<arrow::Table> Statlas::downloadDataRequestSpec(const api::DataRequestSpec& spec) const {
    return downloadParams(spec.toParams());
}

std::vector<download::MetricRequest> Statlas::metricRequests(const query::SearchResults& results) const {
    return results.toMetricRequests(config_);
}

std::string Statlas::sqlText(const query::SearchResults& results, const std::optional<download::KeySet>& keys) const {
    return download::toSqlText(results.toMetricRequests(config_), keys);
}

std::shared_ptr<arrow::Table> Statlas::countries() const {
    return catalog_->countries;
}

} // namespace statlas
