#include "cdb/typed/tables.h"
#include "cdb/typed/typed-errors.h"
#include "typed-test-helpers.h"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace cdb;
using namespace cdb::typed;
using cdb::fdb::ValueType;
using cdb::test::FdbBuilder;
using typed_test::BuiltImage;
using typed_test::null;
using typed_test::text;

class TypedRowTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        FdbBuilder builder;
        builder.add_table_for<MissionTasksSchema>(1)
            .add_row(
                {int32_t{1},
                 int32_t{0},
                 int32_t{3},
                 int32_t{42},
                 text("group"),
                 null(),
                 text(""),
                 null(),
                 int32_t{900},
                 int32_t{7},
                 null(),
                 true,
                 text("live")})
            // uid (required) is null, target has the wrong type
            .add_row(
                {int32_t{2},
                 int32_t{0},
                 int32_t{3},
                 text("not an int"),
                 null(),
                 null(),
                 null(),
                 null(),
                 null(),
                 null(),
                 null(),
                 false,
                 null()});
        image_ = std::make_unique<BuiltImage>(builder);
        table_ = std::make_unique<MissionTasksTable>(image_->table("MissionTasks"));
    }

    std::vector<MissionTasksRow>
    rows() const
    {
        std::vector<MissionTasksRow> result;
        for (auto row : table_->rows())
        {
            result.push_back(row);
        }
        return result;
    }

    std::unique_ptr<BuiltImage> image_;
    std::unique_ptr<MissionTasksTable> table_;
};

TEST_F(TypedRowTest, RequiredAccessorsReturnPlainValues)
{
    auto row = rows().at(0);
    EXPECT_EQ(row.id(), 1);
    EXPECT_EQ(row.task_type(), 3);
    EXPECT_EQ(row.uid(), 7);
    EXPECT_TRUE(row.localize());
}

TEST_F(TypedRowTest, OptionalAccessorsReturnPresentOrAbsent)
{
    auto row = rows().at(0);
    EXPECT_EQ(row.target(), 42);
    EXPECT_EQ(row.target_group()->view(), "group");
    EXPECT_FALSE(row.target_value().has_value());
    EXPECT_EQ(row.icon_id(), 900);
    EXPECT_EQ(row.gate_version()->decode(), "live");
}

TEST_F(TypedRowTest, EmptyTextIsPresentButEmpty)
{
    auto row = rows().at(0);
    auto param = row.task_param1();
    ASSERT_TRUE(param.has_value());
    EXPECT_TRUE(param->empty());
    EXPECT_FALSE(row.large_task_icon().has_value());
}

TEST_F(TypedRowTest, OptionalOfTheWrongTypeReadsAsAbsent)
{
    auto row = rows().at(1);
    EXPECT_NO_THROW(row.target());
    EXPECT_FALSE(row.target().has_value());
}

TEST_F(TypedRowTest, NullRequiredValueIsAContractViolation)
{
    auto row = rows().at(1);
    EXPECT_EQ(row.id(), 2);
    EXPECT_THROW(row.uid(), FieldContractError);
    try
    {
        (void)row.uid();
    }
    catch (const FieldContractError& e)
    {
        std::string what = e.what();
        EXPECT_NE(what.find("MissionTasks"), std::string::npos);
        EXPECT_NE(what.find("uid"), std::string::npos);
    }
    // The unchecked read reports absence instead
    EXPECT_FALSE(row.try_get<MissionTasksSchema::Column::Uid>().has_value());
}

TEST_F(TypedRowTest, VisitColumnsWalksDeclarationOrder)
{
    auto row = rows().at(0);
    std::vector<std::string> names;
    row.visit_columns([&](const ColumnSpec& spec, const auto&) {
        names.emplace_back(spec.name);
    });

    ASSERT_EQ(names.size(), MissionTasksSchema::columns.size());
    EXPECT_EQ(names.front(), "id");
    EXPECT_EQ(names[9], "uid");
    EXPECT_EQ(names.back(), "gate_version");
}

TEST(TypedRow, AbsentOptionalColumnReadsAsAbsentForEveryRow)
{
    FdbBuilder builder;
    builder
        .add_table(
            "Icons",
            {{"IconName", ValueType::Text}, {"IconID", ValueType::Integer}},
            2)
        .add_row_to_bucket(0, {text("a"), int32_t{2}})
        .add_row_to_bucket(1, {text("b"), int32_t{3}});
    BuiltImage image(builder);
    IconsTable icons(image.table("Icons"));

    EXPECT_FALSE(icons.has_column(IconsSchema::Column::IconPath));
    size_t seen = 0;
    for (auto row : icons.rows())
    {
        EXPECT_FALSE(row.icon_path().has_value());
        EXPECT_TRUE(row.icon_name().has_value());
        ++seen;
    }
    EXPECT_EQ(seen, 2u);
}

TEST(TypedRow, ReorderedColumnsReadTheSameValues)
{
    FdbBuilder stock;
    stock.add_table_for<ObjectSkillsSchema>(2).add_row(
        {int32_t{8}, int32_t{55}, int32_t{1}, null()});
    FdbBuilder shuffled;
    shuffled
        .add_table(
            "ObjectSkills",
            {{"AICombatWeight", ValueType::Integer},
             {"skillID", ValueType::Integer},
             {"castOnType", ValueType::Integer},
             {"objectTemplate", ValueType::Integer}},
            2)
        .add_row_to_bucket(0, {null(), int32_t{55}, int32_t{1}, int32_t{8}});

    BuiltImage a(stock);
    BuiltImage b(shuffled);
    ObjectSkillsTable ta(a.table("ObjectSkills"));
    ObjectSkillsTable tb(b.table("ObjectSkills"));

    auto ra = *ta.rows().begin();
    auto rb = *tb.rows().begin();
    EXPECT_EQ(ra.object_template(), rb.object_template());
    EXPECT_EQ(ra.skill_id(), rb.skill_id());
    EXPECT_EQ(ra.cast_on_type(), rb.cast_on_type());
    EXPECT_EQ(ra.ai_combat_weight(), rb.ai_combat_weight());
    EXPECT_EQ(rb.object_template(), 8);
}
