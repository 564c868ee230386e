#include <gtest/gtest.h>
#include "utils/config.h"
#include "utils/errors.h"
#include "support/catalog_fixture.h"

#include <cstdlib>
#include <fstream>

using namespace statlas;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("STATLAS_BASE_PATH");
        unsetenv("STATLAS_CACHE_DIR");
        unsetenv("STATLAS_LOG_LEVEL");
    }

    void TearDown() override {
        unsetenv("STATLAS_BASE_PATH");
        unsetenv("STATLAS_CACHE_DIR");
        unsetenv("STATLAS_LOG_LEVEL");
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = dir_.path() / name;
        std::ofstream(path) << content;
        return path.string();
    }

    statlas::testing::TempDir dir_;
};

TEST_F(ConfigTest, DefaultsPointAtPublishedRelease) {
    Config config;
    EXPECT_EQ(config.base_path, kDefaultBasePath);
    EXPECT_FALSE(config.cache_dir.empty());
    EXPECT_EQ(config.log_level, utils::Logger::Level::INFO);
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(ConfigTest, FromJsonKeepsDefaultsForAbsentKeys) {
    auto config = Config::fromJson(json::parse(R"({"base_path": "/data/release/"})"));
    EXPECT_EQ(config.base_path, "/data/release");
    EXPECT_EQ(config.cache_dir, Config::defaultCacheDir());
}

TEST_F(ConfigTest, FromJsonRejectsWrongTypes) {
    EXPECT_THROW(Config::fromJson(json::parse(R"({"base_path": 3})")), ValidationError);
    EXPECT_THROW(Config::fromJson(json::array()), ValidationError);
}

TEST_F(ConfigTest, LoadJsonFile) {
    auto path = writeFile("statlas.json", R"({
        "base_path": "https://example.org/v1",
        "cache_dir": "/tmp/statlas-cache",
        "logging": {"level": "debug", "file": "out.log"}
    })");
    auto config = Config::loadFile(path);
    EXPECT_EQ(config.base_path, "https://example.org/v1");
    EXPECT_EQ(config.cache_dir, "/tmp/statlas-cache");
    EXPECT_EQ(config.log_level, utils::Logger::Level::DEBUG);
    EXPECT_EQ(config.log_file, "out.log");
}

TEST_F(ConfigTest, LoadYamlFile) {
    auto path = writeFile("statlas.yaml",
                          "base_path: /srv/popdata\n"
                          "logging:\n"
                          "  level: warn\n");
    auto config = Config::loadFile(path);
    EXPECT_EQ(config.base_path, "/srv/popdata");
    EXPECT_EQ(config.log_level, utils::Logger::Level::WARN);
}

TEST_F(ConfigTest, LoadYamlKeepsPlainScalarsAsText) {
    auto path = writeFile("plain.yml",
                          "base_path: 2024\n"
                          "cache_dir: yes\n"
                          "logging:\n"
                          "  level: off\n");
    auto config = Config::loadFile(path);
    EXPECT_EQ(config.base_path, "2024");
    EXPECT_EQ(config.cache_dir, "yes");
    EXPECT_EQ(config.log_level, utils::Logger::Level::OFF);
}

TEST_F(ConfigTest, LoadFileErrors) {
    EXPECT_THROW(Config::loadFile((dir_.path() / "missing.json").string()), ResourceError);
    EXPECT_THROW(Config::loadFile(writeFile("broken.json", "{not json")), ValidationError);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("STATLAS_BASE_PATH", "/env/base", 1);
    setenv("STATLAS_LOG_LEVEL", "error", 1);
    Config config;
    config.applyEnvironment();
    EXPECT_EQ(config.base_path, "/env/base");
    EXPECT_EQ(config.log_level, utils::Logger::Level::ERROR);
}

TEST_F(ConfigTest, ToJsonRoundTrip) {
    Config config;
    config.base_path = "/a/b";
    config.log_level = utils::Logger::Level::TRACE;
    EXPECT_EQ(Config::fromJson(config.toJson()), config);
}
