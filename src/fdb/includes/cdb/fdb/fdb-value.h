#pragma once

#include "cdb/core/types.h"
#include <cstdint>
#include <optional>
#include <ostream>
#include <utility>
#include <variant>

namespace cdb::fdb {

/**
 * Value type codes as stored in column and field headers.
 */
enum class ValueType : std::uint32_t {
    Nothing = 0,
    Integer = 1,
    Float = 3,
    Text = 4,
    Boolean = 5,
    BigInt = 6,
    VarChar = 8
};

/**
 * Convert a ValueType to its name for display/logging
 */
const char*
value_type_to_string(ValueType type);

/**
 * Whether a raw type code names one of the known value types
 */
bool
is_known_value_type(std::uint32_t code);

/**
 * One value read from one column of one row.
 *
 * Text and VarChar values borrow from the backing buffer. Each as_* accessor
 * is empty unless the stored variant matches exactly; there is no numeric
 * conversion between variants.
 */
class Field
{
private:
    ValueType type_;
    std::variant<std::monostate, int32_t, float, bool, int64_t, Latin1Str>
        value_;

    Field(ValueType type, decltype(value_) value)
        : type_(type), value_(std::move(value))
    {
    }

public:
    Field() : type_(ValueType::Nothing), value_(std::monostate{})
    {
    }

    static Field
    null()
    {
        return {};
    }
    static Field
    integer(int32_t v)
    {
        return {ValueType::Integer, v};
    }
    static Field
    real(float v)
    {
        return {ValueType::Float, v};
    }
    static Field
    boolean(bool v)
    {
        return {ValueType::Boolean, v};
    }
    static Field
    bigint(int64_t v)
    {
        return {ValueType::BigInt, v};
    }
    static Field
    text(Latin1Str v)
    {
        return {ValueType::Text, v};
    }
    static Field
    varchar(Latin1Str v)
    {
        return {ValueType::VarChar, v};
    }

    ValueType
    type() const
    {
        return type_;
    }

    bool
    is_null() const
    {
        return type_ == ValueType::Nothing;
    }

    std::optional<int32_t>
    as_integer() const;

    std::optional<float>
    as_float() const;

    std::optional<bool>
    as_boolean() const;

    std::optional<int64_t>
    as_bigint() const;

    // Text variant only; VarChar is a distinct variant
    std::optional<Latin1Str>
    as_text() const;

    std::optional<Latin1Str>
    as_varchar() const;

    bool
    operator==(const Field& other) const;

    bool
    operator!=(const Field& other) const
    {
        return !(*this == other);
    }
};

std::ostream&
operator<<(std::ostream& os, const Field& field);

}  // namespace cdb::fdb
