#pragma once

#include "cdb/core/types.h"
#include "cdb/typed/column-spec.h"
#include "cdb/typed/records.h"
#include "cdb/typed/typed-row.h"
#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace cdb::typed::json {

namespace detail {

boost::json::value
to_value(int32_t v);

boost::json::value
to_value(float v);

boost::json::value
to_value(bool v);

boost::json::value
to_value(int64_t v);

// Text is decoded from Latin-1 to UTF-8
boost::json::value
to_value(const Latin1Str& v);

template <typename T>
boost::json::value
to_value(const std::optional<T>& v)
{
    if (!v)
    {
        return nullptr;
    }
    return to_value(*v);
}

}  // namespace detail

/**
 * Serialize a typed row as a JSON object.
 *
 * Keys are the declared column names in declaration order. Every declared
 * column is present; a missing optional value is written as null.
 *
 * @throws FieldContractError if a required column holds no usable value
 */
template <typename SchemaT>
boost::json::object
to_json(const TypedRow<SchemaT>& row)
{
    boost::json::object obj;
    obj.reserve(SchemaT::columns.size());
    row.visit_columns([&](const ColumnSpec& spec, const auto& value) {
        obj.emplace(
            boost::json::string_view(spec.name.data(), spec.name.size()),
            detail::to_value(value));
    });
    return obj;
}

template <typename RowT>
boost::json::array
to_json(const std::vector<RowT>& rows)
{
    boost::json::array arr;
    arr.reserve(rows.size());
    for (const auto& row : rows)
    {
        arr.emplace_back(to_json(row));
    }
    return arr;
}

boost::json::object
to_json(const Mission& mission);

boost::json::object
to_json(const MissionTask& task);

boost::json::array
to_json(const std::vector<MissionTask>& tasks);

boost::json::object
to_json(const Components& components);

}  // namespace cdb::typed::json
