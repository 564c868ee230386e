#include <gtest/gtest.h>
#include "query/search_engine.h"
#include "catalog/column_names.h"
#include "storage/table_ops.h"
#include "utils/errors.h"
#include "support/catalog_fixture.h"

#include <algorithm>

using namespace statlas;
using namespace statlas::query;
namespace fx = statlas::testing;

class SearchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog::Catalog c;
        for (const char* code : {"bel", "nir", "sco"}) {
            auto part = fx::countryCatalog(code);
            if (!c.metrics) {
                c = part;
                continue;
            }
            c.metrics = storage::concatUnified({c.metrics, part.metrics});
            c.geometries = storage::concatUnified({c.geometries, part.geometries});
            c.source_data_releases = storage::concatUnified({c.source_data_releases, part.source_data_releases});
            c.data_publishers = storage::concatUnified({c.data_publishers, part.data_publishers});
            c.countries = storage::concatUnified({c.countries, part.countries});
        }
        // Scotland shares the level name used by Belgium
        auto levels = fx::strings({"oa", "dz", "oa"});
        c.geometries = c.geometries->SetColumn(c.geometries->schema()->GetFieldIndex(col::GEOMETRY_LEVEL),
                                               arrow::field(col::GEOMETRY_LEVEL, arrow::utf8()),
                                               std::make_shared<arrow::ChunkedArray>(levels)).ValueOrDie();
        view_ = catalog::combinedView(std::make_shared<const catalog::Catalog>(c));
        config_.base_path = "https://host/v1";
    }

    std::shared_ptr<catalog::DenormalizedView> view_;
    Config config_;
};

TEST_F(SearchEngineTest, NoFacetsReturnsWholeView) {
    auto results = search(SearchParams{}, *view_);
    EXPECT_EQ(results.numRows(), 3);
    EXPECT_TRUE(results.table()->Equals(*view_->table()));
}

TEST_F(SearchEngineTest, FacetsNarrowTheView) {
    SearchParams params;
    params.country = TextFilter{"nir", {}};
    auto results = search(params, *view_);
    ASSERT_EQ(results.numRows(), 1);
    EXPECT_EQ(storage::stringValues(results.table(), col::METRIC_ID), (std::vector<std::string>{"m_nir"}));
}

TEST_F(SearchEngineTest, NothingMatches) {
    SearchParams params;
    params.data_publisher = TextFilter{"nobody", {}};
    auto results = search(params, *view_);
    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(results.toMetricRequests(config_).empty());
}

TEST_F(SearchEngineTest, InvalidRegexFailsBeforeTheJoin) {
    SearchParams params;
    params.source_metric_id = TextFilter{"(", {MatchType::Regex, CaseSensitivity::Sensitive}};
    EXPECT_THROW(search(params, *view_), ValidationError);
    EXPECT_FALSE(view_->materialized());
}

TEST_F(SearchEngineTest, MetricRequestsResolveAgainstBasePath) {
    SearchParams params;
    params.metric_id.push_back({"m_bel"});
    auto requests = search(params, *view_).toMetricRequests(config_);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], (download::MetricRequest{"pop_bel", "https://host/v1/bel/metrics/values.parquet",
                                                    "https://host/v1/bel/geometries/areas.fgb"}));
}

TEST_F(SearchEngineTest, GeometryLevelsMostFrequentFirst) {
    auto levels = search(SearchParams{}, *view_).availableGeometryLevels();
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0], (std::pair<std::string, int64_t>{"oa", 2}));
    EXPECT_EQ(levels[1], (std::pair<std::string, int64_t>{"dz", 1}));
}

TEST_F(SearchEngineTest, SummaryUsesDisplayLabels) {
    auto summary = search(SearchParams{}, *view_).summary();
    const auto names = summary->schema()->field_names();
    EXPECT_EQ(names.front(), "Metric ID");
    EXPECT_NE(std::find(names.begin(), names.end(), "Geometry level"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "Country"), names.end());
    EXPECT_EQ(summary->num_rows(), 3);
}
