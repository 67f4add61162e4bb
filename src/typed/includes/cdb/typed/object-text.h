#pragma once

#include "cdb/core/types.h"
#include <cstdint>
#include <optional>
#include <string>

namespace cdb::typed {

/**
 * Display title of an object template.
 *
 * An empty name counts as no name. With both names present and different the
 * result is "{display_name} ({name}) | Object #{id}"; otherwise whichever is
 * present is used, and "Object #{id}" when neither is.
 */
std::string
format_object_title(
    int32_t id,
    std::optional<Latin1Str> name,
    std::optional<Latin1Str> display_name);

/**
 * Description of an object template, "{description} ({internal_notes})" when
 * both are present and different. Empty text counts as absent; the result
 * is empty when neither is present.
 */
std::string
format_object_description(
    std::optional<Latin1Str> description,
    std::optional<Latin1Str> internal_notes);

}  // namespace cdb::typed
