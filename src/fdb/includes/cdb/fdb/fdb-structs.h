#pragma once

#include <array>
#include <cstdint>

namespace cdb::fdb {

// Address value meaning "no structure here" (end of a row list, empty bucket)
static constexpr uint32_t NO_ADDRESS = 0xFFFFFFFF;

// On-disk structures. All addresses are absolute offsets into the file and
// all integers are little-endian.
#pragma pack(push, 1)
struct FileHeader
{
    uint32_t table_count;
    uint32_t table_header_list_addr;
};

struct TableHeader
{
    uint32_t table_def_header_addr;
    uint32_t table_data_header_addr;
};

struct TableDefHeader
{
    uint32_t column_count;
    uint32_t table_name_addr;
    uint32_t column_header_list_addr;
};

struct ColumnHeader
{
    uint32_t column_data_type;
    uint32_t column_name_addr;
};

struct TableDataHeader
{
    uint32_t bucket_count;
    uint32_t bucket_header_list_addr;
};

struct BucketHeader
{
    uint32_t row_header_list_head_addr;
};

struct RowHeaderListEntry
{
    uint32_t row_header_addr;
    uint32_t row_header_list_next_addr;
};

struct RowHeader
{
    uint32_t field_count;
    uint32_t field_data_list_addr;
};

struct FieldData
{
    uint32_t data_type;
    std::array<uint8_t, 4> value;
};
#pragma pack(pop)

static_assert(sizeof(FileHeader) == 8);
static_assert(sizeof(TableDefHeader) == 12);
static_assert(sizeof(FieldData) == 8);

}  // namespace cdb::fdb
