#include "cdb/typed/typed-errors.h"

#include <string>

namespace cdb::typed {

SchemaError::SchemaError(std::string_view table)
    : std::runtime_error("Missing table '" + std::string(table) + "'")
    , table_(table)
{
}

SchemaError::SchemaError(std::string_view table, std::string_view column)
    : std::runtime_error(
          "Missing column '" + std::string(table) + "::" +
          std::string(column) + "'")
    , table_(table)
    , column_(column)
{
}

FieldContractError::FieldContractError(
    std::string_view table,
    std::string_view column,
    std::string_view expected,
    std::string_view found)
    : std::logic_error(
          "Required column '" + std::string(table) + "::" +
          std::string(column) + "' expected " + std::string(expected) +
          ", found " + std::string(found))
{
}

}  // namespace cdb::typed
