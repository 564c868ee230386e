#include "catalog/catalog_cache.h"
#include "io/parquet_io.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <filesystem>
#include <vector>

namespace statlas {
namespace catalog {

namespace fs = std::filesystem;

CatalogCache::CatalogCache(std::string directory) : directory_(std::move(directory)) {}

bool CatalogCache::exists() const {
    std::error_code ec;
    for (const auto& rel : Catalog().relations()) {
        if (!fs::is_regular_file(fs::path(directory_) / rel.first, ec)) {
            return false;
        }
    }
    return true;
}

std::optional<Catalog> CatalogCache::load() const {
    if (!exists()) {
        STATLAS_INFO("No catalog cache at {}", directory_);
        return std::nullopt;
    }
    auto path = [this](const char* file) { return (fs::path(directory_) / file).string(); };
    try {
        Catalog c;
        c.metrics = io::readParquet(path(CatalogFiles::METRICS));
        c.geometries = io::readParquet(path(CatalogFiles::GEOMETRIES));
        c.source_data_releases = io::readParquet(path(CatalogFiles::SOURCE_DATA_RELEASES));
        c.data_publishers = io::readParquet(path(CatalogFiles::DATA_PUBLISHERS));
        c.countries = io::readParquet(path(CatalogFiles::COUNTRIES));
        STATLAS_INFO("Loaded catalog from cache {}", directory_);
        return c;
    } catch (const std::exception& e) {
        // Corrupt Parquet can surface as parquet::ParquetException as well as ResourceError
        STATLAS_WARN("Ignoring unreadable catalog cache {}: {}", directory_, e.what());
        return std::nullopt;
    }
}

void CatalogCache::write(const Catalog& catalog) const {
    bool created = false;
    std::vector<fs::path> touched;
    try {
        created = fs::create_directories(directory_);
        for (const auto& rel : catalog.relations()) {
            if (!rel.second) {
                throw ResourceError("catalog relation '" + rel.first + "' is not loaded");
            }
            touched.push_back(fs::path(directory_) / rel.first);
            io::writeParquet(*rel.second, touched.back().string());
        }
    } catch (const std::exception& e) {
        STATLAS_ERROR("Catalog cache write to {} failed: {}", directory_, e.what());
        // Only what this write produced; the directory may hold other files
        std::error_code ec;
        if (created) {
            fs::remove_all(directory_, ec);
        } else {
            for (const auto& file : touched) {
                fs::remove(file, ec);
                if (ec) break;
            }
        }
        if (ec) {
            STATLAS_WARN("Failed to clean up partial cache {}: {}", directory_, ec.message());
        }
        if (dynamic_cast<const StatlasError*>(&e)) {
            throw;
        }
        throw ResourceError("write catalog cache '" + directory_ + "': " + e.what());
    }
    STATLAS_INFO("Wrote catalog cache to {}", directory_);
}

Catalog loadWithCache(const Config& config, const io::HttpClient& client) {
    CatalogCache cache(config.cache_dir);
    if (auto cached = cache.load()) {
        return std::move(*cached);
    }
    Catalog fresh = loadAll(config, client);
    try {
        cache.write(fresh);
    } catch (const StatlasError& e) {
        STATLAS_WARN("Continuing without catalog cache: {}", e.what());
    }
    return fresh;
}

} // namespace catalog
} // namespace statlas
