#pragma once

#include <cstdint>
#include <optional>

namespace cdb::typed {

// Plain records returned by the domain queries. They own their data and stay
// valid after the database is closed.

struct Mission
{
    std::optional<int32_t> mission_icon_id;
    bool is_mission = true;

    bool
    operator==(const Mission&) const = default;
};

struct MissionTask
{
    std::optional<int32_t> icon_id;
    int32_t uid = 0;

    bool
    operator==(const MissionTask&) const = default;
};

// Components of an object template that the queries care about
struct Components
{
    std::optional<int32_t> render;

    bool
    operator==(const Components&) const = default;
};

}  // namespace cdb::typed
