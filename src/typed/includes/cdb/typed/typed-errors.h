#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace cdb::typed {

/**
 * A table, or a required column of a table, is missing from the file.
 *
 * column() is empty when the whole table is missing.
 */
class SchemaError : public std::runtime_error
{
public:
    explicit SchemaError(std::string_view table);
    SchemaError(std::string_view table, std::string_view column);

    const std::string&
    table() const
    {
        return table_;
    }

    const std::string&
    column() const
    {
        return column_;
    }

private:
    std::string table_;
    std::string column_;
};

/**
 * A required column holds a null or a value of another type.
 *
 * Required columns are validated by name when the table is resolved, so this
 * signals a file whose contents contradict its own schema.
 */
class FieldContractError : public std::logic_error
{
public:
    FieldContractError(
        std::string_view table,
        std::string_view column,
        std::string_view expected,
        std::string_view found);
};

}  // namespace cdb::typed
