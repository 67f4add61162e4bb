#pragma once

#include "cdb/core/types.h"
#include "cdb/fdb/fdb-database.h"
#include "cdb/typed/records.h"
#include "cdb/typed/tables.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cdb::typed {

/**
 * TypedDatabase - the well-known tables of a client database, resolved once
 *
 * Construction looks up every table kind by name and resolves its columns.
 * It throws SchemaError for the first missing table or required column, so a
 * constructed TypedDatabase is always complete.
 *
 * The database borrows the bytes behind the fdb::Database it was built from.
 * Rows and text returned by the queries borrow from both and must not
 * outlive them. The derived records (Mission, MissionTask, Components and the
 * formatted strings) own their data.
 *
 * All queries are read-only and safe to call concurrently.
 */
class TypedDatabase
{
public:
    // Physical positions in Objects read by get_object_name_desc()
    static constexpr size_t OBJECT_NAME_POSITION = 1;
    static constexpr size_t OBJECT_DESCRIPTION_POSITION = 4;
    static constexpr size_t OBJECT_DISPLAY_NAME_POSITION = 7;
    static constexpr size_t OBJECT_INTERNAL_NOTES_POSITION = 10;

    // Physical positions read by get_render_image() and get_components()
    static constexpr size_t RENDER_ICON_ASSET_POSITION = 2;
    static constexpr size_t COMPONENT_TYPE_POSITION = 1;
    static constexpr size_t COMPONENT_ID_POSITION = 2;
    static constexpr int32_t RENDER_COMPONENT_TYPE = 2;

    /**
     * @throws SchemaError if a table or a required column is missing
     */
    explicit TypedDatabase(const fdb::Database& db);

    TypedDatabase(const TypedDatabase&) = delete;
    TypedDatabase&
    operator=(const TypedDatabase&) = delete;

    // Path of an icon; nullopt if the id is unknown or the file has no
    // IconPath column
    std::optional<Latin1Str>
    get_icon_path(int32_t id) const;

    // is_mission reads as true when the stored value is null
    std::optional<Mission>
    get_mission_data(int32_t id) const;

    // One entry per task row of the mission, in bucket order
    std::vector<MissionTask>
    get_mission_tasks(int32_t id) const;

    /**
     * Title and description of an object template.
     *
     * Reads the Objects row by physical position (OBJECT_*_POSITION) rather
     * than by column name, so it assumes the stock Objects layout. A position
     * beyond the end of the row reads as no value.
     */
    std::optional<std::pair<std::string, std::string>>
    get_object_name_desc(int32_t id) const;

    /**
     * Icon asset of a render component.
     *
     * Rows with the id whose icon asset is not text are skipped; the first
     * text value found in bucket order is returned.
     */
    std::optional<Latin1Str>
    get_render_image(int32_t id) const;

    /**
     * Components of an object template.
     *
     * Every registry row with the id and component type 2 overwrites render,
     * so the last one in bucket order wins.
     */
    Components
    get_components(int32_t id) const;

    std::optional<SkillBehaviorRow>
    get_skill_behavior(int32_t skill_id) const;

    std::optional<BehaviorTemplateRow>
    get_behavior_template(int32_t behavior_id) const;

    std::vector<BehaviorParameterRow>
    get_behavior_parameters(int32_t behavior_id) const;

    std::vector<ObjectSkillsRow>
    get_object_skills(int32_t object_template) const;

    std::vector<ItemSetSkillsRow>
    get_item_set_skills(int32_t skill_set_id) const;

    const BehaviorParameterTable&
    behavior_parameters() const
    {
        return behavior_parameters_;
    }
    const BehaviorTemplateTable&
    behavior_templates() const
    {
        return behavior_templates_;
    }
    const ComponentsRegistryTable&
    components_registry() const
    {
        return components_registry_;
    }
    const DestructibleComponentTable&
    destructible_component() const
    {
        return destructible_component_;
    }
    const IconsTable&
    icons() const
    {
        return icons_;
    }
    const ItemSetsTable&
    item_sets() const
    {
        return item_sets_;
    }
    const ItemSetSkillsTable&
    item_set_skills() const
    {
        return item_set_skills_;
    }
    const LootTableTable&
    loot_table() const
    {
        return loot_table_;
    }
    const MissionsTable&
    missions() const
    {
        return missions_;
    }
    const MissionTasksTable&
    mission_tasks() const
    {
        return mission_tasks_;
    }
    const ObjectsTable&
    objects() const
    {
        return objects_;
    }
    const ObjectSkillsTable&
    object_skills() const
    {
        return object_skills_;
    }
    const RebuildComponentTable&
    rebuild_component() const
    {
        return rebuild_component_;
    }
    const RenderComponentTable&
    render_component() const
    {
        return render_component_;
    }
    const SkillBehaviorTable&
    skill_behavior() const
    {
        return skill_behavior_;
    }

private:
    BehaviorParameterTable behavior_parameters_;
    BehaviorTemplateTable behavior_templates_;
    ComponentsRegistryTable components_registry_;
    DestructibleComponentTable destructible_component_;
    IconsTable icons_;
    ItemSetsTable item_sets_;
    ItemSetSkillsTable item_set_skills_;
    LootTableTable loot_table_;
    MissionsTable missions_;
    MissionTasksTable mission_tasks_;
    ObjectsTable objects_;
    ObjectSkillsTable object_skills_;
    RebuildComponentTable rebuild_component_;
    RenderComponentTable render_component_;
    SkillBehaviorTable skill_behavior_;
};

}  // namespace cdb::typed
