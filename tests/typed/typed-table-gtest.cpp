#include "cdb/typed/tables.h"
#include "cdb/typed/typed-errors.h"
#include "typed-test-helpers.h"
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace cdb;
using namespace cdb::typed;
using cdb::fdb::ValueType;
using cdb::test::FdbBuilder;
using typed_test::BuiltImage;
using typed_test::null;
using typed_test::text;

namespace {

std::vector<cdb::test::Cell>
param(int32_t behavior, const char* name, float value)
{
    return {behavior, text(name), value};
}

}  // namespace

class TypedTableTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        FdbBuilder builder;
        builder.add_table_for<BehaviorParameterSchema>(4)
            .add_row(param(5, "radius", 2.5f))
            .add_row(param(1, "damage", 10.0f))
            .add_row(param(5, "angle", 90.0f))
            .add_row(param(-4, "neg", 1.0f))
            .add_row(param(9, "other", 0.0f));
        builder.add_table_for<BehaviorTemplateSchema>(0);
        image_ = std::make_unique<BuiltImage>(builder);
        params_ = std::make_unique<BehaviorParameterTable>(
            image_->table("BehaviorParameter"));
    }

    std::unique_ptr<BuiltImage> image_;
    std::unique_ptr<BehaviorParameterTable> params_;
};

TEST_F(TypedTableTest, GetReturnsFirstMatch)
{
    auto row = params_->get(5);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->parameter_id().view(), "radius");

    EXPECT_FALSE(params_->get(13).has_value());
}

TEST_F(TypedTableTest, GetAllKeepsBucketOrder)
{
    auto rows = params_->get_all(5);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].parameter_id().view(), "radius");
    EXPECT_EQ(rows[1].parameter_id().view(), "angle");
    EXPECT_FLOAT_EQ(rows[1].value(), 90.0f);

    EXPECT_TRUE(params_->get_all(2).empty());
}

TEST_F(TypedTableTest, KeyRowsAreNotFilteredByKey)
{
    // 1, 5 and 9 all land in bucket 1
    std::vector<int32_t> ids;
    for (auto row : params_->key_rows(1))
    {
        ids.push_back(row.behavior_id());
    }
    EXPECT_EQ(ids, (std::vector<int32_t>{5, 1, 5, 9}));
}

TEST_F(TypedTableTest, EmptyBucketYieldsZeroRows)
{
    // Bucket 2 holds nothing
    size_t count = 0;
    for (auto row : params_->key_rows(2))
    {
        (void)row;
        ++count;
    }
    EXPECT_EQ(count, 0u);
    EXPECT_TRUE(params_->key_rows(6).empty());
}

TEST_F(TypedTableTest, NegativeKeysFindTheirRows)
{
    auto row = params_->get(-4);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->parameter_id().view(), "neg");
}

TEST_F(TypedTableTest, FullScanVisitsEveryRow)
{
    size_t count = 0;
    for (auto row : params_->rows())
    {
        (void)row.behavior_id();
        ++count;
    }
    EXPECT_EQ(count, 5u);
}

TEST_F(TypedTableTest, ZeroBucketTableFindsNothing)
{
    BehaviorTemplateTable templates(image_->table("BehaviorTemplate"));
    EXPECT_FALSE(templates.get(0).has_value());
    EXPECT_TRUE(templates.get_all(1).empty());
    EXPECT_TRUE(templates.key_rows(1).empty());
    EXPECT_TRUE(templates.rows().empty());
}

TEST_F(TypedTableTest, PrimaryKeyFollowsItsColumnWhenReordered)
{
    FdbBuilder builder;
    builder
        .add_table(
            "ItemSetSkills",
            {{"SkillID", ValueType::Integer},
             {"SkillSetID", ValueType::Integer}},
            1)
        .add_row({int32_t{7}, int32_t{3}})
        .add_row({int32_t{3}, int32_t{7}});
    BuiltImage image(builder);
    ItemSetSkillsTable table(image.table("ItemSetSkills"));

    auto row = table.get(3);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->skill_set_id(), 3);
    EXPECT_EQ(row->skill_id(), 7);
}
