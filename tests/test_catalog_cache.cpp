#include <gtest/gtest.h>
#include "catalog/catalog_cache.h"
#include "utils/errors.h"
#include "support/catalog_fixture.h"

#include <filesystem>
#include <fstream>

using namespace statlas;
using namespace statlas::catalog;
namespace fx = statlas::testing;
namespace fs = std::filesystem;

class CatalogCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        fx::writeCountryList(remote_.path(), {"bel", "nir"});
        fx::writeCountry(remote_.path(), "bel", fx::countryCatalog("bel"));
        fx::writeCountry(remote_.path(), "nir", fx::countryCatalog("nir"));
        config_.base_path = remote_.str();
        config_.cache_dir = (cache_root_.path() / "catalog").string();
    }

    fx::TempDir remote_;
    fx::TempDir cache_root_;
    Config config_;
};

TEST_F(CatalogCacheTest, MissingCacheIsAMiss) {
    CatalogCache cache(config_.cache_dir);
    EXPECT_FALSE(cache.exists());
    EXPECT_FALSE(cache.load().has_value());
}

TEST_F(CatalogCacheTest, WriteThenLoadGivesEqualCatalog) {
    auto fresh = loadAll(config_);
    CatalogCache cache(config_.cache_dir);
    cache.write(fresh);
    EXPECT_TRUE(cache.exists());

    auto cached = cache.load();
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->equals(fresh));
}

TEST_F(CatalogCacheTest, CorruptFileIsAMiss) {
    CatalogCache cache(config_.cache_dir);
    cache.write(loadAll(config_));
    std::ofstream(fs::path(config_.cache_dir) / CatalogFiles::METRICS, std::ios::trunc) << "not parquet";
    EXPECT_TRUE(cache.exists());
    EXPECT_FALSE(cache.load().has_value());
}

TEST_F(CatalogCacheTest, FailedWriteRemovesDirectory) {
    Catalog partial = loadAll(config_);
    partial.countries.reset();
    CatalogCache cache(config_.cache_dir);
    EXPECT_THROW(cache.write(partial), ResourceError);
    EXPECT_FALSE(fs::exists(config_.cache_dir));
}

TEST_F(CatalogCacheTest, FailedWriteIntoExistingDirectoryKeepsOtherFiles) {
    fs::create_directories(config_.cache_dir);
    const auto foreign = fs::path(config_.cache_dir) / "keep.txt";
    std::ofstream(foreign) << "not ours";

    Catalog partial = loadAll(config_);
    partial.countries.reset();
    CatalogCache cache(config_.cache_dir);
    EXPECT_THROW(cache.write(partial), ResourceError);

    EXPECT_TRUE(fs::exists(foreign));
    EXPECT_FALSE(fs::exists(fs::path(config_.cache_dir) / CatalogFiles::METRICS));
    EXPECT_FALSE(cache.exists());
}

TEST_F(CatalogCacheTest, LoadWithCachePopulatesThenReuses) {
    auto first = loadWithCache(config_);
    EXPECT_TRUE(CatalogCache(config_.cache_dir).exists());

    // Served from the cache even once the source is gone
    fs::remove_all(remote_.path() / "bel");
    auto second = loadWithCache(config_);
    EXPECT_TRUE(second.equals(first));
}

TEST_F(CatalogCacheTest, UnwritableCacheStillReturnsCatalog) {
    // A regular file where the cache directory should go
    std::ofstream(config_.cache_dir) << "blocker";
    auto c = loadWithCache(config_);
    EXPECT_EQ(c.metrics->num_rows(), 2);
}
