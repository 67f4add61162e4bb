#pragma once

#include "cdb/fdb/fdb-database.h"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace cdb::typed {

/**
 * Bucket selection for a signed key.
 *
 * The key's bit pattern is reinterpreted as unsigned before the modulo, so
 * negative keys land on large unsigned values rather than negative indices.
 * bucket_count must be non-zero.
 */
inline size_t
bucket_index(int32_t key, size_t bucket_count)
{
    return static_cast<uint32_t>(key) % bucket_count;
}

/**
 * The bucket a key hashes to, or nullopt if the table has no buckets
 */
inline std::optional<fdb::Bucket>
bucket_for_key(const fdb::Table& table, int32_t key)
{
    if (table.bucket_count() == 0)
    {
        return std::nullopt;
    }
    return table.bucket_at(bucket_index(key, table.bucket_count()));
}

/**
 * Whether the field at position column holds exactly the integer key.
 * Null, missing and non-integer fields never match.
 */
inline bool
field_equals(const fdb::Row& row, size_t column, int32_t key)
{
    auto field = row.field_at(column);
    return field && field->as_integer() == key;
}

namespace detail {

/**
 * First row in the bucket of hash_key whose integer at id_col equals key.
 *
 * The bucket is chosen by hash_key while the comparison uses key, which lets
 * a caller match on a column other than the one the file was bucketed by.
 * This is only correct when every row with that key physically lives in the
 * bucket of hash_key; the caller must pass a hash key consistent with how the
 * buckets were built.
 */
inline std::optional<fdb::Row>
find_in_bucket(
    const fdb::Table& table,
    int32_t hash_key,
    int32_t key,
    size_t id_col)
{
    auto bucket = bucket_for_key(table, hash_key);
    if (!bucket)
    {
        return std::nullopt;
    }
    for (auto row : bucket->rows())
    {
        if (field_equals(row, id_col, key))
        {
            return row;
        }
    }
    return std::nullopt;
}

}  // namespace detail

}  // namespace cdb::typed
