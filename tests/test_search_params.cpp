#include <gtest/gtest.h>
#include "query/search_params.h"
#include "utils/errors.h"

#include <nlohmann/json.hpp>

using namespace statlas;
using namespace statlas::query;
using json = nlohmann::json;

TEST(YearRangeTest, ParseSingleYear) {
    EXPECT_EQ(YearRange::parse("2011"), YearRange::between(2011, 2011));
    EXPECT_EQ(YearRange::parse(" 2011 "), YearRange::between(2011, 2011));
}

TEST(YearRangeTest, ParseOpenAndClosedRanges) {
    EXPECT_EQ(YearRange::parse("...2015"), YearRange::before(2015));
    EXPECT_EQ(YearRange::parse("2000..."), YearRange::after(2000));
    EXPECT_EQ(YearRange::parse("2000...2010"), YearRange::between(2000, 2010));
}

TEST(YearRangeTest, ParseRejectsMalformed) {
    EXPECT_THROW(YearRange::parse(""), ValidationError);
    EXPECT_THROW(YearRange::parse("..."), ValidationError);
    EXPECT_THROW(YearRange::parse("abc"), ValidationError);
    EXPECT_THROW(YearRange::parse("2010...2000"), ValidationError);
    EXPECT_THROW(YearRange::parse("2000...2005...2010"), ValidationError);
    EXPECT_THROW(YearRange::parse("70000"), ValidationError);
    EXPECT_THROW(YearRange::parse("-5"), ValidationError);
}

TEST(YearRangeTest, ParseList) {
    auto ranges = YearRange::parseList("2011,...2015, 2000...2010");
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0], YearRange::between(2011, 2011));
    EXPECT_EQ(ranges[1], YearRange::before(2015));
    EXPECT_EQ(ranges[2], YearRange::between(2000, 2010));
}

TEST(YearRangeTest, ToStringMatchesParseForms) {
    EXPECT_EQ(YearRange::between(2011, 2011).toString(), "2011");
    EXPECT_EQ(YearRange::before(2015).toString(), "...2015");
    EXPECT_EQ(YearRange::after(2000).toString(), "2000...");
    EXPECT_EQ(YearRange::between(2000, 2010).toString(), "2000...2010");
}

TEST(YearRangeTest, JsonForms) {
    EXPECT_EQ(json(YearRange::before(2015)), json::parse(R"({"Before": 2015})"));
    EXPECT_EQ(json(YearRange::between(2000, 2010)), json::parse(R"({"Between": [2000, 2010]})"));
    EXPECT_EQ(json::parse(R"({"After": 1999})").get<YearRange>(), YearRange::after(1999));
    EXPECT_EQ(json("2001...2003").get<YearRange>(), YearRange::between(2001, 2003));
    EXPECT_THROW(json::parse(R"({"Between": [2010, 2000]})").get<YearRange>(), ValidationError);
    EXPECT_THROW(json::parse(R"({"Around": 2000})").get<YearRange>(), ValidationError);
    EXPECT_THROW(json::parse(R"({"After": -1})").get<YearRange>(), ValidationError);
}

TEST(SearchConfigTest, Defaults) {
    SearchConfig config;
    EXPECT_EQ(config.match_type, MatchType::Exact);
    EXPECT_EQ(config.case_sensitivity, CaseSensitivity::Insensitive);

    MetricId id{"abc"};
    EXPECT_EQ(id.config.match_type, MatchType::Startswith);
    EXPECT_EQ(id.config.case_sensitivity, CaseSensitivity::Insensitive);

    SearchText text{"population"};
    EXPECT_EQ(text.context, allSearchContexts());
}

TEST(SearchParamsTest, FromJson) {
    auto params = SearchParams::fromJson(json::parse(R"({
        "text": [{"text": "population", "context": ["Hxl", "Description"],
                  "config": {"match_type": "Contains", "case_sensitivity": "Sensitive"}}],
        "year_range": ["2011", {"Before": 2001}],
        "metric_id": [{"id": "f2ca"}],
        "geometry_level": "oa",
        "country": {"value": "BEL", "config": {"match_type": "Exact"}},
        "region_spec": [{"boundingBox": [0, 0, 1, 1]}]
    })"));

    ASSERT_EQ(params.text.size(), 1u);
    EXPECT_EQ(params.text[0].context, (std::vector<SearchContext>{SearchContext::Hxl, SearchContext::Description}));
    EXPECT_EQ(params.text[0].config.match_type, MatchType::Contains);
    EXPECT_EQ(params.text[0].config.case_sensitivity, CaseSensitivity::Sensitive);

    ASSERT_TRUE(params.year_range.has_value());
    EXPECT_EQ(*params.year_range, (std::vector<YearRange>{YearRange::between(2011, 2011), YearRange::before(2001)}));

    ASSERT_EQ(params.metric_id.size(), 1u);
    EXPECT_EQ(params.metric_id[0].config, metricIdSearchConfig());

    ASSERT_TRUE(params.geometry_level.has_value());
    EXPECT_EQ(params.geometry_level->value, "oa");
    EXPECT_EQ(params.geometry_level->config, SearchConfig{});

    ASSERT_TRUE(params.country.has_value());
    EXPECT_EQ(params.country->value, "BEL");

    ASSERT_EQ(params.region_spec.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<geo::BBox>(params.region_spec[0]));
    EXPECT_FALSE(params.matchesAll());
}

TEST(SearchParamsTest, RegionSpecAloneMatchesAll) {
    SearchParams params;
    params.region_spec.push_back(geo::BBox{{0, 0, 1, 1}});
    EXPECT_TRUE(params.matchesAll());
}

TEST(SearchParamsTest, JsonRoundTripKeepsFacets) {
    SearchParams params;
    params.text.push_back({"households", {SearchContext::HumanReadableName}, {MatchType::Regex, CaseSensitivity::Sensitive}});
    params.year_range = std::vector<YearRange>{YearRange::after(2010)};
    params.source_metric_id = TextFilter{"KS101EW", {}};

    auto back = SearchParams::fromJson(params.toJson());
    ASSERT_EQ(back.text.size(), 1u);
    EXPECT_EQ(back.text[0].text, "households");
    EXPECT_EQ(back.text[0].config.match_type, MatchType::Regex);
    EXPECT_EQ(back.year_range, params.year_range);
    ASSERT_TRUE(back.source_metric_id.has_value());
    EXPECT_EQ(back.source_metric_id->value, "KS101EW");
    EXPECT_FALSE(back.country.has_value());
}

TEST(SearchParamsTest, MalformedJsonIsValidationError) {
    EXPECT_THROW(SearchParams::fromJson(json::array()), ValidationError);
    EXPECT_THROW(SearchParams::fromJson(json::parse(R"({"text": "not a list"})")), ValidationError);
    EXPECT_THROW(SearchParams::fromJson(json::parse(R"({"text": [{"context": ["Hxl"]}]})")), ValidationError);
    EXPECT_THROW(SearchParams::fromJson(json::parse(R"({"text": [{"text": "x", "context": []}]})")), ValidationError);
    EXPECT_THROW(SearchParams::fromJson(json::parse(R"({"metric_id": [{"id": "x", "config": {"match_type": "Fuzzy"}}]})")),
                 ValidationError);
}
