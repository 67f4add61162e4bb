#pragma once

#include "cdb/fdb/fdb-database.h"
#include "cdb/typed/column-spec.h"
#include "cdb/typed/lookup.h"
#include "cdb/typed/typed-row.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace cdb::typed {

/**
 * TypedTable - a raw table plus the column map of its table kind
 *
 * Construction resolves every declared column by name and throws SchemaError
 * if a required one is missing, so a constructed TypedTable always has all
 * of its required columns. Rows handed out by rows(), key_rows(), get() and
 * get_all() keep a pointer to this table's column map and must not outlive
 * it.
 *
 * The first declared column of every schema is the primary key that the file
 * was bucketed by.
 */
template <typename RowT>
class TypedTable
{
public:
    using Row = RowT;
    using Schema = typename RowT::Schema;
    using Column = typename Schema::Column;
    using Map = ColumnMap<Schema>;

    static_assert(
        Schema::columns.size() > 0 && Schema::columns[0].required,
        "the primary key column must be declared first and required");

    explicit TypedTable(const fdb::Table& raw) : raw_(raw), columns_(raw_)
    {
    }

    const fdb::Table&
    raw() const
    {
        return raw_;
    }

    const Map&
    columns() const
    {
        return columns_;
    }

    std::optional<size_t>
    column_index(Column column) const
    {
        return columns_.index_of(column);
    }

    bool
    has_column(Column column) const
    {
        return columns_.index_of(column).has_value();
    }

    // Every row of the table in stored order
    TypedRowRange<RowT>
    rows() const
    {
        return {raw_.rows(), columns_};
    }

    /**
     * Every row of the bucket that key hashes to, in stored order.
     *
     * Rows are not filtered by key; callers that need exact-key semantics
     * compare the key themselves.
     */
    TypedRowRange<RowT>
    key_rows(int32_t key) const
    {
        auto bucket = bucket_for_key(raw_, key);
        if (!bucket)
        {
            return {fdb::RowRange{}, columns_};
        }
        return {bucket->rows(), columns_};
    }

    // First row whose primary key equals key
    std::optional<RowT>
    get(int32_t key) const
    {
        auto row = detail::find_in_bucket(raw_, key, key, primary_column());
        if (!row)
        {
            return std::nullopt;
        }
        return RowT(*row, columns_);
    }

    // Every row whose primary key equals key, in bucket order
    std::vector<RowT>
    get_all(int32_t key) const
    {
        std::vector<RowT> result;
        size_t id_col = primary_column();
        for (auto row : key_rows(key))
        {
            if (field_equals(row.raw(), id_col, key))
            {
                result.push_back(row);
            }
        }
        return result;
    }

private:
    size_t
    primary_column() const
    {
        return *columns_.index_of(static_cast<Column>(0));
    }

    fdb::Table raw_;
    Map columns_;
};

}  // namespace cdb::typed
