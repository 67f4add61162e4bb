#include "cdb/fdb/fdb-database.h"
#include "cdb/fdb/fdb-errors.h"
#include "cdb/fdb/fdb-structs.h"
#include "cdb/test-utils/fdb-builder.h"
#include <cstring>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <vector>

using namespace cdb;
using namespace cdb::fdb;
using cdb::test::Cell;
using cdb::test::FdbBuilder;

namespace {

uint32_t
read_u32(const std::vector<uint8_t>& bytes, uint32_t addr)
{
    uint32_t v;
    std::memcpy(&v, bytes.data() + addr, sizeof(v));
    return v;
}

void
write_u32(std::vector<uint8_t>& bytes, uint32_t addr, uint32_t v)
{
    std::memcpy(bytes.data() + addr, &v, sizeof(v));
}

}  // namespace

class DatabaseTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        FdbBuilder builder;
        builder
            .add_table(
                "Icons",
                {{"IconID", ValueType::Integer},
                 {"IconPath", ValueType::Text},
                 {"IconName", ValueType::Text}},
                4)
            .add_row({int32_t{1}, std::string("a.dds"), std::string("A")})
            .add_row({int32_t{5}, std::string("b.dds"), Cell{}})
            .add_row({int32_t{2}, std::monostate{}, std::string("C")});
        builder.add_table(
            "Empty", {{"id", ValueType::Integer}, {"x", ValueType::Float}}, 0);
        bytes_ = builder.build();
    }

    Database
    db() const
    {
        return Database(bytes_.data(), bytes_.size());
    }

    std::vector<uint8_t> bytes_;
};

TEST_F(DatabaseTest, TablesByIndexAndName)
{
    auto database = db();
    ASSERT_EQ(database.table_count(), 2u);
    EXPECT_EQ(database.table_at(0).name().view(), "Icons");
    EXPECT_EQ(database.table_at(1).name().view(), "Empty");

    auto icons = database.table_by_name("Icons");
    ASSERT_TRUE(icons.has_value());
    EXPECT_EQ(icons->column_count(), 3u);
    EXPECT_EQ(icons->bucket_count(), 4u);

    EXPECT_FALSE(database.table_by_name("icons").has_value());
    EXPECT_FALSE(database.table_by_name("Missing").has_value());

    std::vector<std::string> names;
    for (auto table : database.tables())
    {
        names.push_back(table.name().decode());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"Icons", "Empty"}));
}

TEST_F(DatabaseTest, ColumnsResolveByName)
{
    auto icons = *db().table_by_name("Icons");
    EXPECT_EQ(icons.column_at(1).name.view(), "IconPath");
    EXPECT_EQ(icons.column_at(1).type, ValueType::Text);
    EXPECT_EQ(icons.column_index("IconName"), 2u);
    EXPECT_FALSE(icons.column_index("iconname").has_value());
    EXPECT_THROW(icons.column_at(3), FdbFormatError);
}

TEST_F(DatabaseTest, BucketRowsAndFields)
{
    auto icons = *db().table_by_name("Icons");

    // 1 and 5 share bucket 1 in insertion order
    auto bucket = icons.bucket_for_hash(5);
    ASSERT_TRUE(bucket.has_value());
    EXPECT_EQ(bucket->index(), 1u);

    std::vector<int32_t> ids;
    for (auto row : bucket->rows())
    {
        ASSERT_EQ(row.field_count(), 3u);
        ids.push_back(*row.field_at(0)->as_integer());
    }
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 5}));

    auto first = *bucket->rows().begin();
    EXPECT_EQ(first.field_at(1)->as_text()->view(), "a.dds");
    EXPECT_FALSE(first.field_at(3).has_value());

    auto second = *std::next(bucket->rows().begin());
    EXPECT_TRUE(second.field_at(2)->is_null());
}

TEST_F(DatabaseTest, FieldIterationFollowsColumnOrder)
{
    auto icons = *db().table_by_name("Icons");
    auto row = *icons.bucket_for_hash(2)->rows().begin();

    std::vector<ValueType> types;
    for (auto field : row.fields())
    {
        types.push_back(field.type());
    }
    EXPECT_EQ(
        types,
        (std::vector<ValueType>{
            ValueType::Integer, ValueType::Nothing, ValueType::Text}));
}

TEST_F(DatabaseTest, FieldsOfATemporaryRow)
{
    auto icons = *db().table_by_name("Icons");

    // The range keeps its own copy of the row
    std::vector<ValueType> types;
    for (auto field : (*icons.bucket_at(1)->rows().begin()).fields())
    {
        types.push_back(field.type());
    }
    EXPECT_EQ(
        types,
        (std::vector<ValueType>{
            ValueType::Integer, ValueType::Text, ValueType::Text}));

    auto range = (*icons.bucket_at(2)->rows().begin()).fields();
    auto it = range.begin();
    EXPECT_EQ((*it).as_integer(), 2);
    ++it;
    EXPECT_TRUE((*it).is_null());
    EXPECT_EQ(std::distance(range.begin(), range.end()), 3);
}

TEST_F(DatabaseTest, EmptyBucketYieldsNoRows)
{
    auto icons = *db().table_by_name("Icons");
    auto bucket = icons.bucket_at(3);
    ASSERT_TRUE(bucket.has_value());
    EXPECT_TRUE(bucket->empty());
    EXPECT_TRUE(bucket->rows().empty());
    EXPECT_EQ(bucket->rows().begin(), bucket->rows().end());
    EXPECT_FALSE(icons.bucket_at(4).has_value());
}

TEST_F(DatabaseTest, FullScanSkipsEmptyBucketsAndRestarts)
{
    auto icons = *db().table_by_name("Icons");

    std::vector<int32_t> ids;
    for (auto row : icons.rows())
    {
        ids.push_back(*row.field_at(0)->as_integer());
    }
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 5, 2}));

    // A second scan starts over
    size_t count = 0;
    for (auto row : icons.rows())
    {
        (void)row;
        ++count;
    }
    EXPECT_EQ(count, 3u);
}

TEST_F(DatabaseTest, ZeroBucketTable)
{
    auto empty = *db().table_by_name("Empty");
    EXPECT_EQ(empty.bucket_count(), 0u);
    EXPECT_FALSE(empty.bucket_for_hash(0).has_value());
    EXPECT_FALSE(empty.bucket_for_hash(12345).has_value());
    EXPECT_TRUE(empty.rows().empty());
}

TEST_F(DatabaseTest, TooSmallImageIsRejected)
{
    EXPECT_THROW(Database(bytes_.data(), 4), FdbFormatError);
    EXPECT_THROW(Database(nullptr, 0), FdbFormatError);
}

TEST_F(DatabaseTest, OutOfRangeAddressesAreRejected)
{
    // Point the table list past the end of the image
    write_u32(bytes_, 4, static_cast<uint32_t>(bytes_.size()) + 16);
    auto database = db();
    EXPECT_THROW(database.table_at(0), FdbFormatError);
    EXPECT_THROW(database.table_by_name("Icons"), FdbFormatError);

    write_u32(bytes_, 4, NO_ADDRESS);
    EXPECT_THROW(db().table_at(0), FdbFormatError);
}

TEST_F(DatabaseTest, UnknownValueTypeIsRejected)
{
    // Walk file header -> table 0 data -> bucket 2 -> row -> field 0
    auto table_list = read_u32(bytes_, 4);
    auto data_header = read_u32(bytes_, table_list + 4);
    auto bucket_list = read_u32(bytes_, data_header + 4);
    auto entry = read_u32(bytes_, bucket_list + 2 * 4);
    auto row_header = read_u32(bytes_, entry);
    auto field_list = read_u32(bytes_, row_header + 4);
    write_u32(bytes_, field_list, 2);

    auto icons = *db().table_by_name("Icons");
    auto row = *icons.bucket_at(2)->rows().begin();
    EXPECT_THROW(row.field_at(0), FdbFormatError);
    EXPECT_NO_THROW(row.field_at(2));
    EXPECT_THROW(
        for (auto field : row.fields()) { (void)field; }, FdbFormatError);

    // Codes past the last known type are rejected the same way
    write_u32(bytes_, field_list, 9);
    auto patched = *db().table_by_name("Icons")->bucket_at(2)->rows().begin();
    try
    {
        patched.field_at(0);
        FAIL() << "expected FdbFormatError";
    }
    catch (const FdbFormatError& e)
    {
        EXPECT_NE(
            std::string(e.what()).find("Unknown value type 9"),
            std::string::npos);
    }
}
