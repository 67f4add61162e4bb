#include "cdb/fdb/fdb-value.h"

#include <ostream>

namespace cdb::fdb {

const char*
value_type_to_string(ValueType type)
{
    switch (type)
    {
        case ValueType::Nothing:
            return "Nothing";
        case ValueType::Integer:
            return "Integer";
        case ValueType::Float:
            return "Float";
        case ValueType::Text:
            return "Text";
        case ValueType::Boolean:
            return "Boolean";
        case ValueType::BigInt:
            return "BigInt";
        case ValueType::VarChar:
            return "VarChar";
        default:
            return "Unknown";
    }
}

bool
is_known_value_type(std::uint32_t code)
{
    switch (static_cast<ValueType>(code))
    {
        case ValueType::Nothing:
        case ValueType::Integer:
        case ValueType::Float:
        case ValueType::Text:
        case ValueType::Boolean:
        case ValueType::BigInt:
        case ValueType::VarChar:
            return true;
        default:
            return false;
    }
}

std::optional<int32_t>
Field::as_integer() const
{
    if (type_ != ValueType::Integer)
        return std::nullopt;
    return std::get<int32_t>(value_);
}

std::optional<float>
Field::as_float() const
{
    if (type_ != ValueType::Float)
        return std::nullopt;
    return std::get<float>(value_);
}

std::optional<bool>
Field::as_boolean() const
{
    if (type_ != ValueType::Boolean)
        return std::nullopt;
    return std::get<bool>(value_);
}

std::optional<int64_t>
Field::as_bigint() const
{
    if (type_ != ValueType::BigInt)
        return std::nullopt;
    return std::get<int64_t>(value_);
}

std::optional<Latin1Str>
Field::as_text() const
{
    if (type_ != ValueType::Text)
        return std::nullopt;
    return std::get<Latin1Str>(value_);
}

std::optional<Latin1Str>
Field::as_varchar() const
{
    if (type_ != ValueType::VarChar)
        return std::nullopt;
    return std::get<Latin1Str>(value_);
}

bool
Field::operator==(const Field& other) const
{
    return type_ == other.type_ && value_ == other.value_;
}

std::ostream&
operator<<(std::ostream& os, const Field& field)
{
    switch (field.type())
    {
        case ValueType::Integer:
            return os << *field.as_integer();
        case ValueType::Float:
            return os << *field.as_float();
        case ValueType::Boolean:
            return os << (*field.as_boolean() ? "true" : "false");
        case ValueType::BigInt:
            return os << *field.as_bigint();
        case ValueType::Text:
            return os << *field.as_text();
        case ValueType::VarChar:
            return os << *field.as_varchar();
        case ValueType::Nothing:
            break;
    }
    return os << "NULL";
}

}  // namespace cdb::fdb
