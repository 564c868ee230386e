#include <gtest/gtest.h>
#include "download/transform.h"
#include "utils/errors.h"
#include "support/catalog_fixture.h"

using namespace statlas;
using namespace statlas::download;
using statlas::testing::int64s;
using statlas::testing::makeTable;
using statlas::testing::strings;

class TransformTest : public ::testing::Test {
protected:
    void SetUp() override {
        table_ = makeTable({
            {"GEO_ID", strings({"a", "b"})},
            {"pop", int64s({10, 20})},
            {"households", int64s({4, 9})},
        });
    }

    std::shared_ptr<arrow::Table> table_;
};

TEST_F(TransformTest, RenameColumn) {
    auto out = applyTransform(RenameColumnTransform{"pop", "population"}, table_);
    EXPECT_EQ(out->schema()->field_names(), (std::vector<std::string>{"GEO_ID", "population", "households"}));
    EXPECT_TRUE(out->column(1)->Equals(table_->column(1)));
}

TEST_F(TransformTest, SelectColumnsReorders) {
    auto out = applyTransform(SelectColumnsTransform{{"households", "GEO_ID"}}, table_);
    EXPECT_EQ(out->schema()->field_names(), (std::vector<std::string>{"households", "GEO_ID"}));
    EXPECT_EQ(out->num_rows(), 2);
}

TEST_F(TransformTest, MissingColumnIsValidationError) {
    EXPECT_THROW(applyTransform(RenameColumnTransform{"nope", "x"}, table_), ValidationError);
    EXPECT_THROW(applyTransform(SelectColumnsTransform{{"nope"}}, table_), ValidationError);
}

TEST_F(TransformTest, AppliedLeftToRight) {
    std::vector<Transform> steps{
        RenameColumnTransform{"pop", "population"},
        SelectColumnsTransform{{"GEO_ID", "population"}},
    };
    auto out = applyTransforms(steps, table_);
    EXPECT_EQ(out->schema()->field_names(), (std::vector<std::string>{"GEO_ID", "population"}));
}
