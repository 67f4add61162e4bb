#include "cdb/typed-json/pretty-print.h"
#include <boost/json/serialize.hpp>
#include <iterator>
#include <string>

namespace cdb::typed::json {

namespace {

void
write_value(
    std::ostream& os,
    const boost::json::value& jv,
    size_t depth,
    int indent_width)
{
    const auto width = static_cast<size_t>(indent_width);
    const std::string inner((depth + 1) * width, ' ');
    const std::string outer(depth * width, ' ');

    if (jv.is_object())
    {
        const auto& obj = jv.get_object();
        if (obj.empty())
        {
            os << "{}";
            return;
        }
        os << "{\n";
        for (auto it = obj.begin(); it != obj.end(); ++it)
        {
            os << inner << boost::json::serialize(it->key()) << ": ";
            write_value(os, it->value(), depth + 1, indent_width);
            os << (std::next(it) != obj.end() ? ",\n" : "\n");
        }
        os << outer << "}";
    }
    else if (jv.is_array())
    {
        const auto& arr = jv.get_array();
        if (arr.empty())
        {
            os << "[]";
            return;
        }
        os << "[\n";
        for (auto it = arr.begin(); it != arr.end(); ++it)
        {
            os << inner;
            write_value(os, *it, depth + 1, indent_width);
            os << (std::next(it) != arr.end() ? ",\n" : "\n");
        }
        os << outer << "]";
    }
    else
    {
        // Scalars use the library's own formatting
        os << boost::json::serialize(jv);
    }
}

}  // namespace

void
pretty_print(std::ostream& os, const boost::json::value& jv, int indent_width)
{
    write_value(os, jv, 0, indent_width);
    os << "\n";
}

}  // namespace cdb::typed::json
