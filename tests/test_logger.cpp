#include <gtest/gtest.h>
#include "utils/logger.h"
#include "support/catalog_fixture.h"

#include <filesystem>

using statlas::utils::Logger;

TEST(LoggerTest, LevelNamesRoundTrip) {
    for (auto level : {Logger::Level::TRACE, Logger::Level::DEBUG, Logger::Level::INFO,
                       Logger::Level::WARN, Logger::Level::ERROR, Logger::Level::CRITICAL,
                       Logger::Level::OFF}) {
        EXPECT_EQ(Logger::levelFromString(Logger::levelToString(level)), level);
    }
}

TEST(LoggerTest, LevelNamesIgnoreCaseAndAliases) {
    EXPECT_EQ(Logger::levelFromString("WARNING"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("Err"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("Off"), Logger::Level::OFF);
    EXPECT_EQ(Logger::levelFromString("verbose"), Logger::Level::INFO);
}

TEST(LoggerTest, InitWithFileCreatesIt) {
    statlas::testing::TempDir dir;
    const auto file = dir.path() / "statlas.log";
    Logger::init(file.string(), Logger::Level::DEBUG);
    EXPECT_TRUE(Logger::initialized());
    STATLAS_INFO("catalog has {} rows", 3);
    EXPECT_TRUE(std::filesystem::exists(file));
    Logger::init("", Logger::Level::WARN);
}
