#include "cdb/typed-json/row-json.h"

namespace cdb::typed::json {

namespace detail {

boost::json::value
to_value(int32_t v)
{
    return static_cast<std::int64_t>(v);
}

boost::json::value
to_value(float v)
{
    return static_cast<double>(v);
}

boost::json::value
to_value(bool v)
{
    return v;
}

boost::json::value
to_value(int64_t v)
{
    return v;
}

boost::json::value
to_value(const Latin1Str& v)
{
    return boost::json::string(v.decode());
}

}  // namespace detail

boost::json::object
to_json(const Mission& mission)
{
    boost::json::object obj;
    obj["mission_icon_id"] = detail::to_value(mission.mission_icon_id);
    obj["is_mission"] = mission.is_mission;
    return obj;
}

boost::json::object
to_json(const MissionTask& task)
{
    boost::json::object obj;
    obj["icon_id"] = detail::to_value(task.icon_id);
    obj["uid"] = task.uid;
    return obj;
}

boost::json::array
to_json(const std::vector<MissionTask>& tasks)
{
    boost::json::array arr;
    arr.reserve(tasks.size());
    for (const auto& task : tasks)
    {
        arr.emplace_back(to_json(task));
    }
    return arr;
}

boost::json::object
to_json(const Components& components)
{
    boost::json::object obj;
    obj["render"] = detail::to_value(components.render);
    return obj;
}

}  // namespace cdb::typed::json
