#include <gtest/gtest.h>
#include "geo/region_spec.h"
#include "utils/errors.h"

using namespace statlas;
using namespace statlas::geo;
using json = nlohmann::json;

TEST(BBoxTest, ParseFourCoordinates) {
    auto b = BBox::parse("-1.5, 50.25,0.5,51");
    EXPECT_DOUBLE_EQ(b.minX(), -1.5);
    EXPECT_DOUBLE_EQ(b.minY(), 50.25);
    EXPECT_DOUBLE_EQ(b.maxX(), 0.5);
    EXPECT_DOUBLE_EQ(b.maxY(), 51.0);
}

TEST(BBoxTest, ParseRejectsWrongArity) {
    EXPECT_THROW(BBox::parse("1,2,3"), ValidationError);
    EXPECT_THROW(BBox::parse("1,2,3,4,5"), ValidationError);
    EXPECT_THROW(BBox::parse(""), ValidationError);
}

TEST(BBoxTest, ParseRejectsNonNumbers) {
    EXPECT_THROW(BBox::parse("1,2,x,4"), ValidationError);
    EXPECT_THROW(BBox::parse("1,2,,4"), ValidationError);
    EXPECT_THROW(BBox::parse("1,2,3abc,4"), ValidationError);
}

TEST(RegionSpecTest, JsonForms) {
    auto bbox = json::parse(R"({"boundingBox": [0, 1, 2, 3]})").get<RegionSpec>();
    ASSERT_TRUE(bboxOf(bbox).has_value());
    EXPECT_EQ(*bboxOf(bbox), (BBox{{0, 1, 2, 3}}));

    auto from_string = json::parse(R"({"boundingBox": "0,1,2,3"})").get<RegionSpec>();
    EXPECT_EQ(from_string, bbox);

    auto polygon = json::parse(R"({"polygon": null})").get<RegionSpec>();
    EXPECT_TRUE(std::holds_alternative<PolygonRegion>(polygon));
    EXPECT_FALSE(bboxOf(polygon).has_value());

    auto named = json::parse(R"({"namedArea": "Belfast"})").get<RegionSpec>();
    EXPECT_EQ(std::get<NamedArea>(named).name, "Belfast");
    EXPECT_EQ(describe(named), "named area 'Belfast'");

    EXPECT_EQ(json(RegionSpec{BBox{{0, 1, 2, 3}}}), json::parse(R"({"boundingBox": [0.0, 1.0, 2.0, 3.0]})"));
}

TEST(RegionSpecTest, MalformedJson) {
    EXPECT_THROW(json::parse(R"({"boundingBox": [0, 1, 2]})").get<RegionSpec>(), ValidationError);
    EXPECT_THROW(json::parse(R"({"circle": 3})").get<RegionSpec>(), ValidationError);
    EXPECT_THROW(json::parse(R"({"namedArea": 3})").get<RegionSpec>(), ValidationError);
    EXPECT_THROW(json::parse(R"([1, 2, 3, 4])").get<RegionSpec>(), ValidationError);
}
