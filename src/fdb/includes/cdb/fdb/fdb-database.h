#pragma once

#include "cdb/core/types.h"
#include "cdb/fdb/fdb-errors.h"
#include "cdb/fdb/fdb-structs.h"
#include "cdb/fdb/fdb-value.h"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace cdb::fdb {

/**
 * Bounds-checked reader over the raw bytes of an FDB file.
 *
 * Every read validates the requested range against the image size and throws
 * FdbFormatError if it falls outside. The image does not own the bytes.
 */
class Image
{
private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;

public:
    Image() = default;
    Image(const uint8_t* data, size_t size) : data_(data), size_(size)
    {
    }

    const uint8_t*
    data() const
    {
        return data_;
    }
    size_t
    size() const
    {
        return size_;
    }

    template <typename T>
    T
    read_structure(uint32_t addr) const
    {
        check_range(addr, sizeof(T));
        T result;
        std::memcpy(&result, data_ + addr, sizeof(T));
        return result;
    }

    // Read the NUL-terminated string starting at addr
    Latin1Str
    read_string(uint32_t addr) const;

    void
    check_range(uint32_t addr, size_t length) const;
};

class FieldRange;

/**
 * View of one row: a field count and the location of its field list.
 */
class Row
{
private:
    Image image_;
    uint32_t field_count_ = 0;
    uint32_t field_list_addr_ = NO_ADDRESS;

public:
    Row() = default;
    Row(const Image& image, uint32_t row_header_addr);

    size_t
    field_count() const
    {
        return field_count_;
    }

    /**
     * Decode the field at index
     *
     * @return the field, or nullopt if index is past the last field
     * @throws FdbFormatError on an unknown type code or a bad address
     */
    std::optional<Field>
    field_at(size_t index) const;

    FieldRange
    fields() const;
};

/**
 * Forward iterator over the fields of one row, in declared column order.
 */
class FieldIterator
{
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Field;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Field;

    FieldIterator() = default;
    FieldIterator(const Row& row, size_t index) : row_(row), index_(index)
    {
    }

    // index_ < field_count() for any dereferenceable iterator
    Field
    operator*() const
    {
        return *row_.field_at(index_);
    }

    FieldIterator&
    operator++()
    {
        ++index_;
        return *this;
    }

    FieldIterator
    operator++(int)
    {
        FieldIterator tmp = *this;
        ++index_;
        return tmp;
    }

    bool
    operator==(const FieldIterator& other) const
    {
        return index_ == other.index_;
    }

private:
    Row row_;
    size_t index_ = 0;
};

class FieldRange
{
private:
    Row row_;

public:
    explicit FieldRange(const Row& row) : row_(row)
    {
    }

    FieldIterator
    begin() const
    {
        return {row_, 0};
    }
    FieldIterator
    end() const
    {
        return {row_, row_.field_count()};
    }
};

inline FieldRange
Row::fields() const
{
    return FieldRange(*this);
}

/**
 * Forward iterator over rows in a contiguous run of buckets.
 *
 * Walks each bucket's row list in stored order, then moves on to the next
 * non-empty bucket. A full table scan runs over [0, bucket_count), a
 * bucket-scoped scan over [index, index + 1).
 */
class RowIterator
{
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Row;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Row;

    RowIterator() = default;
    RowIterator(
        const Image& image,
        uint32_t bucket_list_addr,
        uint32_t bucket,
        uint32_t bucket_end);

    Row
    operator*() const;

    RowIterator&
    operator++();

    RowIterator
    operator++(int)
    {
        RowIterator tmp = *this;
        ++(*this);
        return tmp;
    }

    bool
    operator==(const RowIterator& other) const
    {
        return bucket_ == other.bucket_ && entry_ == other.entry_;
    }

private:
    // Position on the head of the first non-empty bucket at or after bucket_
    void
    settle();

    Image image_;
    uint32_t bucket_list_addr_ = NO_ADDRESS;
    uint32_t bucket_ = 0;
    uint32_t bucket_end_ = 0;
    uint32_t entry_ = NO_ADDRESS;
};

/**
 * Restartable range of rows; each begin() starts a fresh scan.
 */
class RowRange
{
private:
    Image image_;
    uint32_t bucket_list_addr_ = NO_ADDRESS;
    uint32_t bucket_begin_ = 0;
    uint32_t bucket_end_ = 0;

public:
    RowRange() = default;
    RowRange(
        const Image& image,
        uint32_t bucket_list_addr,
        uint32_t bucket_begin,
        uint32_t bucket_end)
        : image_(image)
        , bucket_list_addr_(bucket_list_addr)
        , bucket_begin_(bucket_begin)
        , bucket_end_(bucket_end)
    {
    }

    RowIterator
    begin() const
    {
        return {image_, bucket_list_addr_, bucket_begin_, bucket_end_};
    }
    RowIterator
    end() const
    {
        return {image_, bucket_list_addr_, bucket_end_, bucket_end_};
    }
    bool
    empty() const
    {
        return begin() == end();
    }
};

/**
 * One bucket of a table: the rows whose primary key hashed to this slot
 * when the file was built.
 */
class Bucket
{
private:
    Image image_;
    uint32_t bucket_list_addr_ = NO_ADDRESS;
    uint32_t index_ = 0;

public:
    Bucket() = default;
    Bucket(const Image& image, uint32_t bucket_list_addr, uint32_t index)
        : image_(image), bucket_list_addr_(bucket_list_addr), index_(index)
    {
    }

    uint32_t
    index() const
    {
        return index_;
    }

    RowRange
    rows() const
    {
        return {image_, bucket_list_addr_, index_, index_ + 1};
    }

    bool
    empty() const;
};

/**
 * Schema entry of one column
 */
struct Column
{
    Latin1Str name;
    ValueType type;
};

/**
 * View of one table: its schema (name, columns) and its bucket array.
 */
class Table
{
private:
    Image image_;
    TableDefHeader def_{};
    TableDataHeader data_{};

public:
    Table() = default;
    Table(const Image& image, const TableHeader& header);

    Latin1Str
    name() const;

    size_t
    column_count() const
    {
        return def_.column_count;
    }

    /**
     * @throws FdbFormatError if index >= column_count()
     */
    Column
    column_at(size_t index) const;

    /**
     * Find a column by exact name
     *
     * @return the zero-based column position, or nullopt if absent
     */
    std::optional<size_t>
    column_index(std::string_view name) const;

    size_t
    bucket_count() const
    {
        return data_.bucket_count;
    }

    // nullopt if index >= bucket_count()
    std::optional<Bucket>
    bucket_at(size_t index) const;

    // The bucket at hash % bucket_count(); nullopt if there are no buckets
    std::optional<Bucket>
    bucket_for_hash(uint32_t hash) const;

    // All rows, bucket by bucket
    RowRange
    rows() const
    {
        return {image_, data_.bucket_header_list_addr, 0, data_.bucket_count};
    }
};

/**
 * Zero-copy view over a complete FDB image.
 *
 * The bytes must stay valid and unchanged for as long as the Database or any
 * Table, Bucket, Row, Field or Latin1Str obtained from it is in use.
 */
class Database
{
private:
    Image image_;
    FileHeader header_{};

public:
    /**
     * @throws FdbFormatError if the image is too small for a file header
     */
    Database(const uint8_t* data, size_t size);

    size_t
    table_count() const
    {
        return header_.table_count;
    }

    /**
     * @throws FdbFormatError if index >= table_count()
     */
    Table
    table_at(size_t index) const;

    // Exact byte match on the stored table name
    std::optional<Table>
    table_by_name(std::string_view name) const;

    class TableIterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Table;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Table;

        TableIterator() = default;
        TableIterator(const Database* db, size_t index) : db_(db), index_(index)
        {
        }

        Table
        operator*() const
        {
            return db_->table_at(index_);
        }
        TableIterator&
        operator++()
        {
            ++index_;
            return *this;
        }
        TableIterator
        operator++(int)
        {
            TableIterator tmp = *this;
            ++index_;
            return tmp;
        }
        bool
        operator==(const TableIterator& other) const
        {
            return index_ == other.index_;
        }

    private:
        const Database* db_ = nullptr;
        size_t index_ = 0;
    };

    struct TableRange
    {
        const Database* db;

        TableIterator
        begin() const
        {
            return {db, 0};
        }
        TableIterator
        end() const
        {
            return {db, db->table_count()};
        }
    };

    TableRange
    tables() const
    {
        return {this};
    }
};

}  // namespace cdb::fdb
