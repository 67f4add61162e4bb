#include "cdb/fdb/fdb-database.h"

#include <cstring>
#include <sstream>
#include <string>

namespace cdb::fdb {

//----------------------------------------------------------
// Image
//----------------------------------------------------------

void
Image::check_range(uint32_t addr, size_t length) const
{
    if (addr == NO_ADDRESS || static_cast<size_t>(addr) > size_ ||
        length > size_ - addr)
    {
        std::ostringstream oss;
        oss << "Address 0x" << std::hex << addr << std::dec << " (+" << length
            << " bytes) is outside the " << size_ << " byte image";
        throw FdbFormatError(oss.str());
    }
}

Latin1Str
Image::read_string(uint32_t addr) const
{
    check_range(addr, 1);
    const auto* start = data_ + addr;
    const auto* terminator =
        static_cast<const uint8_t*>(std::memchr(start, 0, size_ - addr));
    if (!terminator)
    {
        throw FdbFormatError(
            "Unterminated string at address " + std::to_string(addr));
    }
    return {start, static_cast<size_t>(terminator - start)};
}

//----------------------------------------------------------
// Row
//----------------------------------------------------------

Row::Row(const Image& image, uint32_t row_header_addr) : image_(image)
{
    auto header = image_.read_structure<RowHeader>(row_header_addr);
    field_count_ = header.field_count;
    field_list_addr_ = header.field_data_list_addr;
}

std::optional<Field>
Row::field_at(size_t index) const
{
    if (index >= field_count_)
    {
        return std::nullopt;
    }

    auto addr = static_cast<uint64_t>(field_list_addr_) +
        index * sizeof(FieldData);
    if (addr >= NO_ADDRESS)
    {
        throw FdbFormatError("Field list runs past the addressable range");
    }
    auto data = image_.read_structure<FieldData>(static_cast<uint32_t>(addr));
    if (!is_known_value_type(data.data_type))
    {
        throw FdbFormatError(
            "Unknown value type " + std::to_string(data.data_type) +
            " in field " + std::to_string(index));
    }

    switch (static_cast<ValueType>(data.data_type))
    {
        case ValueType::Nothing:
            return Field::null();
        case ValueType::Integer: {
            int32_t v;
            std::memcpy(&v, data.value.data(), sizeof(v));
            return Field::integer(v);
        }
        case ValueType::Float: {
            float v;
            std::memcpy(&v, data.value.data(), sizeof(v));
            return Field::real(v);
        }
        case ValueType::Boolean: {
            uint32_t v;
            std::memcpy(&v, data.value.data(), sizeof(v));
            return Field::boolean(v != 0);
        }
        default: {
            // Text, VarChar and BigInt hold the address of their value
            uint32_t target;
            std::memcpy(&target, data.value.data(), sizeof(target));
            if (data.data_type == static_cast<uint32_t>(ValueType::BigInt))
            {
                return Field::bigint(image_.read_structure<int64_t>(target));
            }
            auto str = image_.read_string(target);
            return data.data_type == static_cast<uint32_t>(ValueType::Text)
                ? Field::text(str)
                : Field::varchar(str);
        }
    }
}

//----------------------------------------------------------
// RowIterator
//----------------------------------------------------------

RowIterator::RowIterator(
    const Image& image,
    uint32_t bucket_list_addr,
    uint32_t bucket,
    uint32_t bucket_end)
    : image_(image)
    , bucket_list_addr_(bucket_list_addr)
    , bucket_(bucket)
    , bucket_end_(bucket_end)
{
    settle();
}

void
RowIterator::settle()
{
    entry_ = NO_ADDRESS;
    while (bucket_ < bucket_end_)
    {
        auto addr = static_cast<uint64_t>(bucket_list_addr_) +
            static_cast<uint64_t>(bucket_) * sizeof(BucketHeader);
        if (addr >= NO_ADDRESS)
        {
            throw FdbFormatError("Bucket list runs past the addressable range");
        }
        auto header =
            image_.read_structure<BucketHeader>(static_cast<uint32_t>(addr));
        if (header.row_header_list_head_addr != NO_ADDRESS)
        {
            entry_ = header.row_header_list_head_addr;
            return;
        }
        ++bucket_;
    }
}

Row
RowIterator::operator*() const
{
    auto entry = image_.read_structure<RowHeaderListEntry>(entry_);
    return {image_, entry.row_header_addr};
}

RowIterator&
RowIterator::operator++()
{
    auto entry = image_.read_structure<RowHeaderListEntry>(entry_);
    if (entry.row_header_list_next_addr != NO_ADDRESS)
    {
        entry_ = entry.row_header_list_next_addr;
    }
    else
    {
        ++bucket_;
        settle();
    }
    return *this;
}

//----------------------------------------------------------
// Bucket
//----------------------------------------------------------

bool
Bucket::empty() const
{
    auto addr = static_cast<uint64_t>(bucket_list_addr_) +
        static_cast<uint64_t>(index_) * sizeof(BucketHeader);
    if (addr >= NO_ADDRESS)
    {
        throw FdbFormatError("Bucket list runs past the addressable range");
    }
    auto header =
        image_.read_structure<BucketHeader>(static_cast<uint32_t>(addr));
    return header.row_header_list_head_addr == NO_ADDRESS;
}

//----------------------------------------------------------
// Table
//----------------------------------------------------------

Table::Table(const Image& image, const TableHeader& header) : image_(image)
{
    def_ = image_.read_structure<TableDefHeader>(header.table_def_header_addr);
    data_ =
        image_.read_structure<TableDataHeader>(header.table_data_header_addr);
}

Latin1Str
Table::name() const
{
    return image_.read_string(def_.table_name_addr);
}

Column
Table::column_at(size_t index) const
{
    if (index >= def_.column_count)
    {
        throw FdbFormatError(
            "Column index " + std::to_string(index) + " out of range for " +
            name().decode());
    }
    auto addr = static_cast<uint64_t>(def_.column_header_list_addr) +
        index * sizeof(ColumnHeader);
    if (addr >= NO_ADDRESS)
    {
        throw FdbFormatError("Column list runs past the addressable range");
    }
    auto header =
        image_.read_structure<ColumnHeader>(static_cast<uint32_t>(addr));
    return {
        image_.read_string(header.column_name_addr),
        static_cast<ValueType>(header.column_data_type)};
}

std::optional<size_t>
Table::column_index(std::string_view name) const
{
    for (size_t i = 0; i < def_.column_count; ++i)
    {
        if (column_at(i).name.view() == name)
        {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<Bucket>
Table::bucket_at(size_t index) const
{
    if (index >= data_.bucket_count)
    {
        return std::nullopt;
    }
    return Bucket(
        image_,
        data_.bucket_header_list_addr,
        static_cast<uint32_t>(index));
}

std::optional<Bucket>
Table::bucket_for_hash(uint32_t hash) const
{
    if (data_.bucket_count == 0)
    {
        return std::nullopt;
    }
    return bucket_at(hash % data_.bucket_count);
}

//----------------------------------------------------------
// Database
//----------------------------------------------------------

Database::Database(const uint8_t* data, size_t size) : image_(data, size)
{
    if (!data || size < sizeof(FileHeader))
    {
        throw FdbFormatError("Image too small to contain an FDB header");
    }
    header_ = image_.read_structure<FileHeader>(0);
}

Table
Database::table_at(size_t index) const
{
    if (index >= header_.table_count)
    {
        throw FdbFormatError(
            "Table index " + std::to_string(index) + " out of range (" +
            std::to_string(header_.table_count) + " tables)");
    }
    auto addr = static_cast<uint64_t>(header_.table_header_list_addr) +
        index * sizeof(TableHeader);
    if (addr >= NO_ADDRESS)
    {
        throw FdbFormatError("Table list runs past the addressable range");
    }
    auto header =
        image_.read_structure<TableHeader>(static_cast<uint32_t>(addr));
    return {image_, header};
}

std::optional<Table>
Database::table_by_name(std::string_view name) const
{
    for (auto table : tables())
    {
        if (table.name().view() == name)
        {
            return table;
        }
    }
    return std::nullopt;
}

}  // namespace cdb::fdb
