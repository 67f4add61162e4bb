#include "cdb/typed/column-spec.h"
#include "cdb/core/logger.h"
#include "cdb/typed/typed-errors.h"

namespace cdb::typed {

namespace {
// Resolution detail is only interesting when chasing schema drift
LogPartition&
resolve_log()
{
    static LogPartition partition("TYPED");
    return partition;
}
}  // namespace

const char*
value_kind_to_string(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Integer:
            return "Integer";
        case ValueKind::Float:
            return "Float";
        case ValueKind::Boolean:
            return "Boolean";
        case ValueKind::Text:
            return "Text";
        case ValueKind::BigInt:
            return "BigInt";
    }
    return "Unknown";
}

std::vector<std::optional<size_t>>
resolve_columns(
    const fdb::Table& table,
    std::string_view table_name,
    std::span<const ColumnSpec> columns)
{
    std::vector<std::optional<size_t>> result;
    result.reserve(columns.size());

    for (const auto& spec : columns)
    {
        auto index = table.column_index(spec.name);
        if (!index)
        {
            if (spec.required)
            {
                LOGE(
                    "Required column ",
                    table_name,
                    "::",
                    spec.name,
                    " is missing");
                throw SchemaError(table_name, spec.name);
            }
            PLOGW(
                resolve_log(),
                "Optional column ",
                table_name,
                "::",
                spec.name,
                " is missing");
        }
        else
        {
            PLOGD(
                resolve_log(),
                table_name,
                "::",
                spec.name,
                " -> column ",
                *index);
        }
        result.push_back(index);
    }

    return result;
}

}  // namespace cdb::typed
