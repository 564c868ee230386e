#pragma once

#include "catalog/metadata_catalog.h"
#include "utils/config.h"

#include <optional>
#include <string>

namespace statlas {
namespace catalog {

/**
 * @brief On-disk snapshot of a Catalog: the five relations as ZSTD Parquet
 * files under one directory
 *
 * Written once per process after a remote load; no protocol for concurrent
 * writers.
 */
class CatalogCache {
public:
    explicit CatalogCache(std::string directory);

    /// True if all five relation files are present
    bool exists() const;

    /**
     * @brief Read the snapshot back
     *
     * A missing or unreadable snapshot is a miss (nullopt); read errors are
     * logged, never thrown.
     */
    std::optional<Catalog> load() const;

    /**
     * @brief Write all five relations
     *
     * On failure the directory is removed if this call created it, otherwise
     * only the relation files it wrote are; the error is re-thrown.
     * @throws ResourceError
     */
    void write(const Catalog& catalog) const;

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

/**
 * @brief Cached catalog when the cache is readable, else loadAll() followed
 * by a cache write
 *
 * A failed cache write is logged; the freshly loaded catalog is still returned.
 */
Catalog loadWithCache(const Config& config, const io::HttpClient& client = io::HttpClient());

} // namespace catalog
} // namespace statlas
