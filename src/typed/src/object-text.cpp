#include "cdb/typed/object-text.h"
#include <sstream>

namespace cdb::typed {

namespace {
std::optional<Latin1Str>
non_empty(std::optional<Latin1Str> text)
{
    if (text && text->empty())
    {
        return std::nullopt;
    }
    return text;
}
}  // namespace

std::string
format_object_title(
    int32_t id,
    std::optional<Latin1Str> name,
    std::optional<Latin1Str> display_name)
{
    name = non_empty(name);
    display_name = non_empty(display_name);

    std::ostringstream oss;
    if (name && display_name && *display_name != *name)
    {
        oss << display_name->decode() << " (" << name->decode() << ") | ";
    }
    else if (name)
    {
        oss << name->decode() << " | ";
    }
    else if (display_name)
    {
        oss << display_name->decode() << " | ";
    }
    oss << "Object #" << id;
    return oss.str();
}

std::string
format_object_description(
    std::optional<Latin1Str> description,
    std::optional<Latin1Str> internal_notes)
{
    description = non_empty(description);
    internal_notes = non_empty(internal_notes);

    if (description && internal_notes && *description != *internal_notes)
    {
        return description->decode() + " (" + internal_notes->decode() + ")";
    }
    if (description)
    {
        return description->decode();
    }
    if (internal_notes)
    {
        return internal_notes->decode();
    }
    return {};
}

}  // namespace cdb::typed
