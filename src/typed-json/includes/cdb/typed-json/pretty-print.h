#pragma once

#include <boost/json/value.hpp>
#include <ostream>

namespace cdb::typed::json {

/**
 * Write a JSON value with one member or element per line, indented by
 * indent_width spaces per level, followed by a newline.
 */
void
pretty_print(
    std::ostream& os,
    const boost::json::value& jv,
    int indent_width = 2);

}  // namespace cdb::typed::json
