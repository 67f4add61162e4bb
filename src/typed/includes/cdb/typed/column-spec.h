#pragma once

#include "cdb/core/types.h"
#include "cdb/fdb/fdb-database.h"
#include "cdb/fdb/fdb-value.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cdb::typed {

/**
 * The value type a well-known column is declared to hold
 */
enum class ValueKind { Integer, Float, Boolean, Text, BigInt };

const char*
value_kind_to_string(ValueKind kind);

/**
 * Declaration of one well-known column of a table kind.
 *
 * A schema lists its ColumnSpecs in the same order as its Column enum, so
 * the enum value doubles as the index into the list.
 */
struct ColumnSpec
{
    std::string_view name;
    ValueKind kind;
    bool required;
};

// Decoding of a Field into the C++ type of each ValueKind
template <ValueKind K>
struct KindTraits;

template <>
struct KindTraits<ValueKind::Integer>
{
    using type = int32_t;
    static std::optional<type>
    extract(const fdb::Field& f)
    {
        return f.as_integer();
    }
};

template <>
struct KindTraits<ValueKind::Float>
{
    using type = float;
    static std::optional<type>
    extract(const fdb::Field& f)
    {
        return f.as_float();
    }
};

template <>
struct KindTraits<ValueKind::Boolean>
{
    using type = bool;
    static std::optional<type>
    extract(const fdb::Field& f)
    {
        return f.as_boolean();
    }
};

template <>
struct KindTraits<ValueKind::Text>
{
    using type = Latin1Str;
    static std::optional<type>
    extract(const fdb::Field& f)
    {
        return f.as_text();
    }
};

template <>
struct KindTraits<ValueKind::BigInt>
{
    using type = int64_t;
    static std::optional<type>
    extract(const fdb::Field& f)
    {
        return f.as_bigint();
    }
};

/**
 * Resolve declared column names against a table's own schema.
 *
 * Each entry of the result is the real zero-based position of the column
 * with that name, or nullopt for an absent optional column.
 *
 * @throws SchemaError naming the table and column if a required column is
 * absent
 */
std::vector<std::optional<size_t>>
resolve_columns(
    const fdb::Table& table,
    std::string_view table_name,
    std::span<const ColumnSpec> columns);

/**
 * Column Resolution Map of one table kind: symbolic column -> real position.
 */
template <typename Schema>
class ColumnMap
{
public:
    using Column = typename Schema::Column;
    static constexpr size_t column_count = Schema::columns.size();

    explicit ColumnMap(const fdb::Table& table)
    {
        auto resolved =
            resolve_columns(table, Schema::table_name, Schema::columns);
        for (size_t i = 0; i < column_count; ++i)
        {
            index_[i] = resolved[i];
        }
    }

    std::optional<size_t>
    index_of(Column column) const
    {
        return index_[static_cast<size_t>(column)];
    }

    static constexpr const ColumnSpec&
    spec(Column column)
    {
        return Schema::columns[static_cast<size_t>(column)];
    }

private:
    std::array<std::optional<size_t>, column_count> index_{};
};

}  // namespace cdb::typed
