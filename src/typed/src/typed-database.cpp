#include "cdb/typed/typed-database.h"
#include "cdb/core/logger.h"
#include "cdb/typed/lookup.h"
#include "cdb/typed/object-text.h"
#include "cdb/typed/typed-errors.h"

namespace cdb::typed {

namespace {

template <typename TableT>
TableT
open_table(const fdb::Database& db)
{
    constexpr auto name = TableT::Schema::table_name;
    auto raw = db.table_by_name(name);
    if (!raw)
    {
        LOGE("Missing table ", name);
        throw SchemaError(name);
    }
    return TableT(*raw);
}

// Text at a physical position, nullopt past the end of the row
std::optional<Latin1Str>
text_at(const fdb::Row& row, size_t position)
{
    auto field = row.field_at(position);
    if (!field)
    {
        return std::nullopt;
    }
    return field->as_text();
}

}  // namespace

TypedDatabase::TypedDatabase(const fdb::Database& db)
    : behavior_parameters_(open_table<BehaviorParameterTable>(db))
    , behavior_templates_(open_table<BehaviorTemplateTable>(db))
    , components_registry_(open_table<ComponentsRegistryTable>(db))
    , destructible_component_(open_table<DestructibleComponentTable>(db))
    , icons_(open_table<IconsTable>(db))
    , item_sets_(open_table<ItemSetsTable>(db))
    , item_set_skills_(open_table<ItemSetSkillsTable>(db))
    , loot_table_(open_table<LootTableTable>(db))
    , missions_(open_table<MissionsTable>(db))
    , mission_tasks_(open_table<MissionTasksTable>(db))
    , objects_(open_table<ObjectsTable>(db))
    , object_skills_(open_table<ObjectSkillsTable>(db))
    , rebuild_component_(open_table<RebuildComponentTable>(db))
    , render_component_(open_table<RenderComponentTable>(db))
    , skill_behavior_(open_table<SkillBehaviorTable>(db))
{
    LOGI("Resolved 15 typed tables out of ", db.table_count(), " in file");
}

std::optional<Latin1Str>
TypedDatabase::get_icon_path(int32_t id) const
{
    if (!icons_.has_column(IconsSchema::Column::IconPath))
    {
        return std::nullopt;
    }
    auto row = icons_.get(id);
    if (!row)
    {
        return std::nullopt;
    }
    return row->icon_path();
}

std::optional<Mission>
TypedDatabase::get_mission_data(int32_t id) const
{
    auto row = missions_.get(id);
    if (!row)
    {
        return std::nullopt;
    }

    Mission mission;
    mission.mission_icon_id = row->mission_icon_id();
    mission.is_mission =
        row->try_get<MissionsSchema::Column::IsMission>().value_or(true);
    return mission;
}

std::vector<MissionTask>
TypedDatabase::get_mission_tasks(int32_t id) const
{
    std::vector<MissionTask> tasks;
    tasks.reserve(4);
    for (const auto& row : mission_tasks_.get_all(id))
    {
        tasks.push_back({row.icon_id(), row.uid()});
    }
    return tasks;
}

std::optional<std::pair<std::string, std::string>>
TypedDatabase::get_object_name_desc(int32_t id) const
{
    auto row = detail::find_in_bucket(objects_.raw(), id, id, 0);
    if (!row)
    {
        return std::nullopt;
    }

    auto title = format_object_title(
        id,
        text_at(*row, OBJECT_NAME_POSITION),
        text_at(*row, OBJECT_DISPLAY_NAME_POSITION));
    auto description = format_object_description(
        text_at(*row, OBJECT_DESCRIPTION_POSITION),
        text_at(*row, OBJECT_INTERNAL_NOTES_POSITION));
    return std::make_pair(std::move(title), std::move(description));
}

std::optional<Latin1Str>
TypedDatabase::get_render_image(int32_t id) const
{
    auto bucket = bucket_for_key(render_component_.raw(), id);
    if (!bucket)
    {
        return std::nullopt;
    }
    for (auto row : bucket->rows())
    {
        if (!field_equals(row, 0, id))
        {
            continue;
        }
        if (auto asset = text_at(row, RENDER_ICON_ASSET_POSITION))
        {
            return asset;
        }
    }
    return std::nullopt;
}

Components
TypedDatabase::get_components(int32_t id) const
{
    Components components;
    auto bucket = bucket_for_key(components_registry_.raw(), id);
    if (!bucket)
    {
        return components;
    }
    for (auto row : bucket->rows())
    {
        if (!field_equals(row, 0, id) ||
            !field_equals(row, COMPONENT_TYPE_POSITION, RENDER_COMPONENT_TYPE))
        {
            continue;
        }
        auto component_id = row.field_at(COMPONENT_ID_POSITION);
        components.render =
            component_id ? component_id->as_integer() : std::nullopt;
    }
    return components;
}

std::optional<SkillBehaviorRow>
TypedDatabase::get_skill_behavior(int32_t skill_id) const
{
    return skill_behavior_.get(skill_id);
}

std::optional<BehaviorTemplateRow>
TypedDatabase::get_behavior_template(int32_t behavior_id) const
{
    return behavior_templates_.get(behavior_id);
}

std::vector<BehaviorParameterRow>
TypedDatabase::get_behavior_parameters(int32_t behavior_id) const
{
    return behavior_parameters_.get_all(behavior_id);
}

std::vector<ObjectSkillsRow>
TypedDatabase::get_object_skills(int32_t object_template) const
{
    return object_skills_.get_all(object_template);
}

std::vector<ItemSetSkillsRow>
TypedDatabase::get_item_set_skills(int32_t skill_set_id) const
{
    return item_set_skills_.get_all(skill_set_id);
}

}  // namespace cdb::typed
