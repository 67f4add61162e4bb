#pragma once

#include "cdb/core/types.h"
#include "cdb/typed/column-spec.h"
#include "cdb/typed/typed-row.h"
#include "cdb/typed/typed-table.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Well-known tables of CDClient.fdb.
//
// Each table kind has a schema (lookup name, serialized record name, column
// enum and column declarations in the same order), a row class with one
// accessor per column, and a TypedTable alias. Required columns must exist in
// the file; optional ones may be absent and read as std::nullopt.

namespace cdb::typed {

//----------------------------------------------------------
// BehaviorParameter
//----------------------------------------------------------
struct BehaviorParameterSchema
{
    static constexpr std::string_view table_name = "BehaviorParameter";
    static constexpr std::string_view record_name = "BehaviorParameter";

    enum class Column { BehaviorId, ParameterId, Value };

    static constexpr std::array<ColumnSpec, 3> columns{{
        {"behaviorID", ValueKind::Integer, true},
        {"parameterID", ValueKind::Text, true},
        {"value", ValueKind::Float, true},
    }};
};

class BehaviorParameterRow : public TypedRow<BehaviorParameterSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    behavior_id() const
    {
        return get<Column::BehaviorId>();
    }
    Latin1Str
    parameter_id() const
    {
        return get<Column::ParameterId>();
    }
    float
    value() const
    {
        return get<Column::Value>();
    }
};

using BehaviorParameterTable = TypedTable<BehaviorParameterRow>;

//----------------------------------------------------------
// BehaviorTemplate
//----------------------------------------------------------
struct BehaviorTemplateSchema
{
    static constexpr std::string_view table_name = "BehaviorTemplate";
    static constexpr std::string_view record_name = "BehaviorTemplate";

    enum class Column { BehaviorId, TemplateId, EffectId, EffectHandle };

    static constexpr std::array<ColumnSpec, 4> columns{{
        {"behaviorID", ValueKind::Integer, true},
        {"templateID", ValueKind::Integer, true},
        {"effectID", ValueKind::Integer, false},
        {"effectHandle", ValueKind::Text, false},
    }};
};

class BehaviorTemplateRow : public TypedRow<BehaviorTemplateSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    behavior_id() const
    {
        return get<Column::BehaviorId>();
    }
    int32_t
    template_id() const
    {
        return get<Column::TemplateId>();
    }
    std::optional<int32_t>
    effect_id() const
    {
        return get<Column::EffectId>();
    }
    std::optional<Latin1Str>
    effect_handle() const
    {
        return get<Column::EffectHandle>();
    }
};

using BehaviorTemplateTable = TypedTable<BehaviorTemplateRow>;

//----------------------------------------------------------
// ComponentsRegistry
//----------------------------------------------------------
struct ComponentsRegistrySchema
{
    static constexpr std::string_view table_name = "ComponentsRegistry";
    static constexpr std::string_view record_name = "ComponentsRegistry";

    enum class Column { Id, ComponentType, ComponentId };

    static constexpr std::array<ColumnSpec, 3> columns{{
        {"id", ValueKind::Integer, true},
        {"component_type", ValueKind::Integer, true},
        {"component_id", ValueKind::Integer, false},
    }};
};

class ComponentsRegistryRow : public TypedRow<ComponentsRegistrySchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    id() const
    {
        return get<Column::Id>();
    }
    int32_t
    component_type() const
    {
        return get<Column::ComponentType>();
    }
    std::optional<int32_t>
    component_id() const
    {
        return get<Column::ComponentId>();
    }
};

using ComponentsRegistryTable = TypedTable<ComponentsRegistryRow>;

//----------------------------------------------------------
// DestructibleComponent
//----------------------------------------------------------
struct DestructibleComponentSchema
{
    static constexpr std::string_view table_name = "DestructibleComponent";
    static constexpr std::string_view record_name = "DestructibleComponent";

    enum class Column {
        Id,
        Faction,
        FactionList,
        Life,
        Imagination,
        LootMatrixIndex,
        CurrencyIndex,
        Level,
        Armor,
        DeathBehavior,
        IsNpc,
        AttackPriority,
        IsSmashable,
        DifficultyLevel
    };

    static constexpr std::array<ColumnSpec, 14> columns{{
        {"id", ValueKind::Integer, true},
        {"faction", ValueKind::Integer, false},
        {"factionList", ValueKind::Text, false},
        {"life", ValueKind::Integer, false},
        {"imagination", ValueKind::Integer, false},
        {"LootMatrixIndex", ValueKind::Integer, false},
        {"CurrencyIndex", ValueKind::Integer, false},
        {"level", ValueKind::Integer, false},
        {"armor", ValueKind::Float, false},
        {"death_behavior", ValueKind::Integer, false},
        {"isnpc", ValueKind::Boolean, false},
        {"attack_priority", ValueKind::Integer, false},
        {"isSmashable", ValueKind::Boolean, false},
        {"difficultyLevel", ValueKind::Integer, false},
    }};
};

class DestructibleComponentRow : public TypedRow<DestructibleComponentSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    id() const
    {
        return get<Column::Id>();
    }
    std::optional<int32_t>
    faction() const
    {
        return get<Column::Faction>();
    }
    std::optional<Latin1Str>
    faction_list() const
    {
        return get<Column::FactionList>();
    }
    std::optional<int32_t>
    life() const
    {
        return get<Column::Life>();
    }
    std::optional<int32_t>
    imagination() const
    {
        return get<Column::Imagination>();
    }
    std::optional<int32_t>
    loot_matrix_index() const
    {
        return get<Column::LootMatrixIndex>();
    }
    std::optional<int32_t>
    currency_index() const
    {
        return get<Column::CurrencyIndex>();
    }
    std::optional<int32_t>
    level() const
    {
        return get<Column::Level>();
    }
    std::optional<float>
    armor() const
    {
        return get<Column::Armor>();
    }
    std::optional<int32_t>
    death_behavior() const
    {
        return get<Column::DeathBehavior>();
    }
    std::optional<bool>
    is_npc() const
    {
        return get<Column::IsNpc>();
    }
    std::optional<int32_t>
    attack_priority() const
    {
        return get<Column::AttackPriority>();
    }
    std::optional<bool>
    is_smashable() const
    {
        return get<Column::IsSmashable>();
    }
    std::optional<int32_t>
    difficulty_level() const
    {
        return get<Column::DifficultyLevel>();
    }
};

using DestructibleComponentTable = TypedTable<DestructibleComponentRow>;

//----------------------------------------------------------
// Icons
//----------------------------------------------------------
struct IconsSchema
{
    static constexpr std::string_view table_name = "Icons";
    static constexpr std::string_view record_name = "Icon";

    enum class Column { IconId, IconPath, IconName };

    static constexpr std::array<ColumnSpec, 3> columns{{
        {"IconID", ValueKind::Integer, true},
        {"IconPath", ValueKind::Text, false},
        {"IconName", ValueKind::Text, false},
    }};
};

class IconsRow : public TypedRow<IconsSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    icon_id() const
    {
        return get<Column::IconId>();
    }
    std::optional<Latin1Str>
    icon_path() const
    {
        return get<Column::IconPath>();
    }
    std::optional<Latin1Str>
    icon_name() const
    {
        return get<Column::IconName>();
    }
};

using IconsTable = TypedTable<IconsRow>;

//----------------------------------------------------------
// ItemSets
//----------------------------------------------------------
struct ItemSetsSchema
{
    static constexpr std::string_view table_name = "ItemSets";
    static constexpr std::string_view record_name = "ItemSet";

    enum class Column {
        SetId,
        LocStatus,
        ItemIds,
        KitType,
        KitRank,
        KitImage,
        SkillSetWith2,
        SkillSetWith3,
        SkillSetWith4,
        SkillSetWith5,
        SkillSetWith6,
        Localize,
        GateVersion,
        KitId,
        Priority
    };

    static constexpr std::array<ColumnSpec, 15> columns{{
        {"setID", ValueKind::Integer, true},
        {"locStatus", ValueKind::Integer, true},
        {"itemIDs", ValueKind::Text, true},
        {"kitType", ValueKind::Integer, false},
        {"kitRank", ValueKind::Integer, false},
        {"kitImage", ValueKind::Integer, false},
        {"skillSetWith2", ValueKind::Integer, false},
        {"skillSetWith3", ValueKind::Integer, false},
        {"skillSetWith4", ValueKind::Integer, false},
        {"skillSetWith5", ValueKind::Integer, false},
        {"skillSetWith6", ValueKind::Integer, false},
        {"localize", ValueKind::Boolean, false},
        {"gate_version", ValueKind::Text, false},
        {"kitID", ValueKind::Integer, false},
        {"priority", ValueKind::Float, false},
    }};
};

class ItemSetsRow : public TypedRow<ItemSetsSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    set_id() const
    {
        return get<Column::SetId>();
    }
    int32_t
    loc_status() const
    {
        return get<Column::LocStatus>();
    }
    Latin1Str
    item_ids() const
    {
        return get<Column::ItemIds>();
    }
    std::optional<int32_t>
    kit_type() const
    {
        return get<Column::KitType>();
    }
    std::optional<int32_t>
    kit_rank() const
    {
        return get<Column::KitRank>();
    }
    std::optional<int32_t>
    kit_image() const
    {
        return get<Column::KitImage>();
    }
    std::optional<int32_t>
    skill_set_with_2() const
    {
        return get<Column::SkillSetWith2>();
    }
    std::optional<int32_t>
    skill_set_with_3() const
    {
        return get<Column::SkillSetWith3>();
    }
    std::optional<int32_t>
    skill_set_with_4() const
    {
        return get<Column::SkillSetWith4>();
    }
    std::optional<int32_t>
    skill_set_with_5() const
    {
        return get<Column::SkillSetWith5>();
    }
    std::optional<int32_t>
    skill_set_with_6() const
    {
        return get<Column::SkillSetWith6>();
    }
    std::optional<bool>
    localize() const
    {
        return get<Column::Localize>();
    }
    std::optional<Latin1Str>
    gate_version() const
    {
        return get<Column::GateVersion>();
    }
    std::optional<int32_t>
    kit_id() const
    {
        return get<Column::KitId>();
    }
    std::optional<float>
    priority() const
    {
        return get<Column::Priority>();
    }
};

using ItemSetsTable = TypedTable<ItemSetsRow>;

//----------------------------------------------------------
// ItemSetSkills
//----------------------------------------------------------
struct ItemSetSkillsSchema
{
    static constexpr std::string_view table_name = "ItemSetSkills";
    static constexpr std::string_view record_name = "ItemSetSkill";

    enum class Column { SkillSetId, SkillId, SkillCastType };

    static constexpr std::array<ColumnSpec, 3> columns{{
        {"SkillSetID", ValueKind::Integer, true},
        {"SkillID", ValueKind::Integer, true},
        {"SkillCastType", ValueKind::Integer, false},
    }};
};

class ItemSetSkillsRow : public TypedRow<ItemSetSkillsSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    skill_set_id() const
    {
        return get<Column::SkillSetId>();
    }
    int32_t
    skill_id() const
    {
        return get<Column::SkillId>();
    }
    std::optional<int32_t>
    skill_cast_type() const
    {
        return get<Column::SkillCastType>();
    }
};

using ItemSetSkillsTable = TypedTable<ItemSetSkillsRow>;

//----------------------------------------------------------
// LootTable
//----------------------------------------------------------
struct LootTableSchema
{
    static constexpr std::string_view table_name = "LootTable";
    static constexpr std::string_view record_name = "LootTable";

    enum class Column { ItemId, LootTableIndex, Id, MissionDrop, SortPriority };

    static constexpr std::array<ColumnSpec, 5> columns{{
        {"itemid", ValueKind::Integer, true},
        {"LootTableIndex", ValueKind::Integer, true},
        {"id", ValueKind::Integer, true},
        {"MissionDrop", ValueKind::Boolean, true},
        {"sortPriority", ValueKind::Integer, false},
    }};
};

class LootTableRow : public TypedRow<LootTableSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    item_id() const
    {
        return get<Column::ItemId>();
    }
    int32_t
    loot_table_index() const
    {
        return get<Column::LootTableIndex>();
    }
    int32_t
    id() const
    {
        return get<Column::Id>();
    }
    bool
    mission_drop() const
    {
        return get<Column::MissionDrop>();
    }
    std::optional<int32_t>
    sort_priority() const
    {
        return get<Column::SortPriority>();
    }
};

using LootTableTable = TypedTable<LootTableRow>;

//----------------------------------------------------------
// Missions
//----------------------------------------------------------
struct MissionsSchema
{
    static constexpr std::string_view table_name = "Missions";
    static constexpr std::string_view record_name = "Mission";

    enum class Column {
        Id,
        DefinedType,
        DefinedSubtype,
        IsMission,
        UiSortOrder,
        MissionIconId
    };

    static constexpr std::array<ColumnSpec, 6> columns{{
        {"id", ValueKind::Integer, true},
        {"defined_type", ValueKind::Text, false},
        {"defined_subtype", ValueKind::Text, false},
        {"isMission", ValueKind::Boolean, true},
        {"UISortOrder", ValueKind::Integer, false},
        {"missionIconID", ValueKind::Integer, false},
    }};
};

class MissionsRow : public TypedRow<MissionsSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    id() const
    {
        return get<Column::Id>();
    }
    std::optional<Latin1Str>
    defined_type() const
    {
        return get<Column::DefinedType>();
    }
    std::optional<Latin1Str>
    defined_subtype() const
    {
        return get<Column::DefinedSubtype>();
    }
    bool
    is_mission() const
    {
        return get<Column::IsMission>();
    }
    std::optional<int32_t>
    ui_sort_order() const
    {
        return get<Column::UiSortOrder>();
    }
    std::optional<int32_t>
    mission_icon_id() const
    {
        return get<Column::MissionIconId>();
    }
};

using MissionsTable = TypedTable<MissionsRow>;

//----------------------------------------------------------
// MissionTasks
//----------------------------------------------------------
struct MissionTasksSchema
{
    static constexpr std::string_view table_name = "MissionTasks";
    static constexpr std::string_view record_name = "MissionTask";

    enum class Column {
        Id,
        LocStatus,
        TaskType,
        Target,
        TargetGroup,
        TargetValue,
        TaskParam1,
        LargeTaskIcon,
        IconId,
        Uid,
        LargeTaskIconId,
        Localize,
        GateVersion
    };

    static constexpr std::array<ColumnSpec, 13> columns{{
        {"id", ValueKind::Integer, true},
        {"locStatus", ValueKind::Integer, true},
        {"taskType", ValueKind::Integer, true},
        {"target", ValueKind::Integer, false},
        {"targetGroup", ValueKind::Text, false},
        {"targetValue", ValueKind::Integer, false},
        {"taskParam1", ValueKind::Text, false},
        {"largeTaskIcon", ValueKind::Text, false},
        {"IconID", ValueKind::Integer, false},
        {"uid", ValueKind::Integer, true},
        {"largeTaskIconID", ValueKind::Integer, false},
        {"localize", ValueKind::Boolean, true},
        {"gate_version", ValueKind::Text, false},
    }};
};

class MissionTasksRow : public TypedRow<MissionTasksSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    id() const
    {
        return get<Column::Id>();
    }
    int32_t
    loc_status() const
    {
        return get<Column::LocStatus>();
    }
    int32_t
    task_type() const
    {
        return get<Column::TaskType>();
    }
    std::optional<int32_t>
    target() const
    {
        return get<Column::Target>();
    }
    std::optional<Latin1Str>
    target_group() const
    {
        return get<Column::TargetGroup>();
    }
    std::optional<int32_t>
    target_value() const
    {
        return get<Column::TargetValue>();
    }
    std::optional<Latin1Str>
    task_param1() const
    {
        return get<Column::TaskParam1>();
    }
    std::optional<Latin1Str>
    large_task_icon() const
    {
        return get<Column::LargeTaskIcon>();
    }
    std::optional<int32_t>
    icon_id() const
    {
        return get<Column::IconId>();
    }
    int32_t
    uid() const
    {
        return get<Column::Uid>();
    }
    std::optional<int32_t>
    large_task_icon_id() const
    {
        return get<Column::LargeTaskIconId>();
    }
    bool
    localize() const
    {
        return get<Column::Localize>();
    }
    std::optional<Latin1Str>
    gate_version() const
    {
        return get<Column::GateVersion>();
    }
};

using MissionTasksTable = TypedTable<MissionTasksRow>;

//----------------------------------------------------------
// Objects
//----------------------------------------------------------
struct ObjectsSchema
{
    static constexpr std::string_view table_name = "Objects";
    static constexpr std::string_view record_name = "Object";

    enum class Column {
        Id,
        Name,
        Placeable,
        Type,
        Description,
        Localize,
        NpcTemplateId,
        DisplayName,
        InteractionDistance,
        Nametag,
        InternalNotes,
        LocStatus,
        GateVersion,
        HqValid
    };

    static constexpr std::array<ColumnSpec, 14> columns{{
        {"id", ValueKind::Integer, true},
        {"name", ValueKind::Text, false},
        {"placeable", ValueKind::Boolean, false},
        {"type", ValueKind::Text, false},
        {"description", ValueKind::Text, false},
        {"localize", ValueKind::Boolean, false},
        {"npcTemplateID", ValueKind::Integer, false},
        {"displayName", ValueKind::Text, false},
        {"interactionDistance", ValueKind::Float, false},
        {"nametag", ValueKind::Boolean, false},
        {"_internalNotes", ValueKind::Text, false},
        {"locStatus", ValueKind::Integer, false},
        {"gate_version", ValueKind::Text, false},
        {"HQ_valid", ValueKind::Boolean, false},
    }};
};

class ObjectsRow : public TypedRow<ObjectsSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    id() const
    {
        return get<Column::Id>();
    }
    std::optional<Latin1Str>
    name() const
    {
        return get<Column::Name>();
    }
    std::optional<bool>
    placeable() const
    {
        return get<Column::Placeable>();
    }
    std::optional<Latin1Str>
    type() const
    {
        return get<Column::Type>();
    }
    std::optional<Latin1Str>
    description() const
    {
        return get<Column::Description>();
    }
    std::optional<bool>
    localize() const
    {
        return get<Column::Localize>();
    }
    std::optional<int32_t>
    npc_template_id() const
    {
        return get<Column::NpcTemplateId>();
    }
    std::optional<Latin1Str>
    display_name() const
    {
        return get<Column::DisplayName>();
    }
    std::optional<float>
    interaction_distance() const
    {
        return get<Column::InteractionDistance>();
    }
    std::optional<bool>
    nametag() const
    {
        return get<Column::Nametag>();
    }
    std::optional<Latin1Str>
    internal_notes() const
    {
        return get<Column::InternalNotes>();
    }
    std::optional<int32_t>
    loc_status() const
    {
        return get<Column::LocStatus>();
    }
    std::optional<Latin1Str>
    gate_version() const
    {
        return get<Column::GateVersion>();
    }
    std::optional<bool>
    hq_valid() const
    {
        return get<Column::HqValid>();
    }
};

using ObjectsTable = TypedTable<ObjectsRow>;

//----------------------------------------------------------
// ObjectSkills
//----------------------------------------------------------
struct ObjectSkillsSchema
{
    static constexpr std::string_view table_name = "ObjectSkills";
    static constexpr std::string_view record_name = "ObjectSkill";

    enum class Column { ObjectTemplate, SkillId, CastOnType, AiCombatWeight };

    static constexpr std::array<ColumnSpec, 4> columns{{
        {"objectTemplate", ValueKind::Integer, true},
        {"skillID", ValueKind::Integer, true},
        {"castOnType", ValueKind::Integer, false},
        {"AICombatWeight", ValueKind::Integer, false},
    }};
};

class ObjectSkillsRow : public TypedRow<ObjectSkillsSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    object_template() const
    {
        return get<Column::ObjectTemplate>();
    }
    int32_t
    skill_id() const
    {
        return get<Column::SkillId>();
    }
    std::optional<int32_t>
    cast_on_type() const
    {
        return get<Column::CastOnType>();
    }
    std::optional<int32_t>
    ai_combat_weight() const
    {
        return get<Column::AiCombatWeight>();
    }
};

using ObjectSkillsTable = TypedTable<ObjectSkillsRow>;

//----------------------------------------------------------
// RebuildComponent
//----------------------------------------------------------
struct RebuildComponentSchema
{
    static constexpr std::string_view table_name = "RebuildComponent";
    static constexpr std::string_view record_name = "RebuildComponent";

    enum class Column {
        Id,
        ResetTime,
        CompleteTime,
        TakeImagination,
        Interruptible,
        SelfActivator,
        CustomModules,
        ActivityId,
        PostImaginationCost,
        TimeBeforeSmash
    };

    static constexpr std::array<ColumnSpec, 10> columns{{
        {"id", ValueKind::Integer, true},
        {"reset_time", ValueKind::Float, false},
        {"complete_time", ValueKind::Float, false},
        {"take_imagination", ValueKind::Integer, false},
        {"interruptible", ValueKind::Boolean, false},
        {"self_activator", ValueKind::Boolean, false},
        {"custom_modules", ValueKind::Text, false},
        {"activityID", ValueKind::Integer, false},
        {"post_imagination_cost", ValueKind::Integer, false},
        {"time_before_smash", ValueKind::Float, false},
    }};
};

class RebuildComponentRow : public TypedRow<RebuildComponentSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    id() const
    {
        return get<Column::Id>();
    }
    std::optional<float>
    reset_time() const
    {
        return get<Column::ResetTime>();
    }
    std::optional<float>
    complete_time() const
    {
        return get<Column::CompleteTime>();
    }
    std::optional<int32_t>
    take_imagination() const
    {
        return get<Column::TakeImagination>();
    }
    std::optional<bool>
    interruptible() const
    {
        return get<Column::Interruptible>();
    }
    std::optional<bool>
    self_activator() const
    {
        return get<Column::SelfActivator>();
    }
    std::optional<Latin1Str>
    custom_modules() const
    {
        return get<Column::CustomModules>();
    }
    std::optional<int32_t>
    activity_id() const
    {
        return get<Column::ActivityId>();
    }
    std::optional<int32_t>
    post_imagination_cost() const
    {
        return get<Column::PostImaginationCost>();
    }
    std::optional<float>
    time_before_smash() const
    {
        return get<Column::TimeBeforeSmash>();
    }
};

using RebuildComponentTable = TypedTable<RebuildComponentRow>;

//----------------------------------------------------------
// RenderComponent
//----------------------------------------------------------
struct RenderComponentSchema
{
    static constexpr std::string_view table_name = "RenderComponent";
    static constexpr std::string_view record_name = "RenderComponent";

    enum class Column {
        Id,
        RenderAsset,
        IconAsset,
        IconId,
        ShaderId,
        Effect1,
        Effect2,
        Effect3,
        Effect4,
        Effect5,
        Effect6,
        AnimationGroupIds,
        Fade,
        UseDropShadow,
        PreloadAnimations
    };

    static constexpr std::array<ColumnSpec, 15> columns{{
        {"id", ValueKind::Integer, true},
        {"render_asset", ValueKind::Text, false},
        {"icon_asset", ValueKind::Text, false},
        {"IconID", ValueKind::Integer, false},
        {"shader_id", ValueKind::Integer, false},
        {"effect1", ValueKind::Integer, false},
        {"effect2", ValueKind::Integer, false},
        {"effect3", ValueKind::Integer, false},
        {"effect4", ValueKind::Integer, false},
        {"effect5", ValueKind::Integer, false},
        {"effect6", ValueKind::Integer, false},
        {"animationGroupIDs", ValueKind::Text, false},
        {"fade", ValueKind::Boolean, false},
        {"usedropshadow", ValueKind::Boolean, false},
        {"preloadAnimations", ValueKind::Boolean, false},
    }};
};

class RenderComponentRow : public TypedRow<RenderComponentSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    id() const
    {
        return get<Column::Id>();
    }
    std::optional<Latin1Str>
    render_asset() const
    {
        return get<Column::RenderAsset>();
    }
    std::optional<Latin1Str>
    icon_asset() const
    {
        return get<Column::IconAsset>();
    }
    std::optional<int32_t>
    icon_id() const
    {
        return get<Column::IconId>();
    }
    std::optional<int32_t>
    shader_id() const
    {
        return get<Column::ShaderId>();
    }
    std::optional<int32_t>
    effect1() const
    {
        return get<Column::Effect1>();
    }
    std::optional<int32_t>
    effect2() const
    {
        return get<Column::Effect2>();
    }
    std::optional<int32_t>
    effect3() const
    {
        return get<Column::Effect3>();
    }
    std::optional<int32_t>
    effect4() const
    {
        return get<Column::Effect4>();
    }
    std::optional<int32_t>
    effect5() const
    {
        return get<Column::Effect5>();
    }
    std::optional<int32_t>
    effect6() const
    {
        return get<Column::Effect6>();
    }
    std::optional<Latin1Str>
    animation_group_ids() const
    {
        return get<Column::AnimationGroupIds>();
    }
    std::optional<bool>
    fade() const
    {
        return get<Column::Fade>();
    }
    std::optional<bool>
    use_drop_shadow() const
    {
        return get<Column::UseDropShadow>();
    }
    std::optional<bool>
    preload_animations() const
    {
        return get<Column::PreloadAnimations>();
    }
};

using RenderComponentTable = TypedTable<RenderComponentRow>;

//----------------------------------------------------------
// SkillBehavior
//----------------------------------------------------------
struct SkillBehaviorSchema
{
    static constexpr std::string_view table_name = "SkillBehavior";
    static constexpr std::string_view record_name = "SkillBehavior";

    enum class Column {
        SkillId,
        LocStatus,
        BehaviorId,
        ImaginationCost,
        CooldownGroup,
        Cooldown,
        InNpcEditor,
        SkillIcon,
        OomSkillId,
        OomBehaviorEffectId,
        CastTypeDesc,
        ImBonusUi,
        LifeBonusUi,
        ArmorBonusUi,
        DamageUi,
        HideIcon,
        Localize,
        GateVersion,
        CancelType
    };

    static constexpr std::array<ColumnSpec, 19> columns{{
        {"skillID", ValueKind::Integer, true},
        {"locStatus", ValueKind::Integer, true},
        {"behaviorID", ValueKind::Integer, true},
        {"imaginationcost", ValueKind::Integer, true},
        {"cooldowngroup", ValueKind::Integer, true},
        {"cooldown", ValueKind::Float, true},
        {"inNpcEditor", ValueKind::Boolean, true},
        {"skillIcon", ValueKind::Integer, true},
        {"oomSkillID", ValueKind::Text, true},
        {"oomBehaviorEffectID", ValueKind::Integer, true},
        {"castTypeDesc", ValueKind::Integer, true},
        {"imBonusUI", ValueKind::Integer, true},
        {"lifeBonusUI", ValueKind::Integer, true},
        {"armorBonusUI", ValueKind::Integer, true},
        {"damageUI", ValueKind::Integer, true},
        {"hideIcon", ValueKind::Boolean, true},
        {"localize", ValueKind::Boolean, true},
        {"gate_version", ValueKind::Text, true},
        {"cancelType", ValueKind::Integer, true},
    }};
};

class SkillBehaviorRow : public TypedRow<SkillBehaviorSchema>
{
public:
    using TypedRow::TypedRow;

    int32_t
    skill_id() const
    {
        return get<Column::SkillId>();
    }
    int32_t
    loc_status() const
    {
        return get<Column::LocStatus>();
    }
    int32_t
    behavior_id() const
    {
        return get<Column::BehaviorId>();
    }
    int32_t
    imagination_cost() const
    {
        return get<Column::ImaginationCost>();
    }
    int32_t
    cooldown_group() const
    {
        return get<Column::CooldownGroup>();
    }
    float
    cooldown() const
    {
        return get<Column::Cooldown>();
    }
    bool
    in_npc_editor() const
    {
        return get<Column::InNpcEditor>();
    }
    int32_t
    skill_icon() const
    {
        return get<Column::SkillIcon>();
    }
    Latin1Str
    oom_skill_id() const
    {
        return get<Column::OomSkillId>();
    }
    int32_t
    oom_behavior_effect_id() const
    {
        return get<Column::OomBehaviorEffectId>();
    }
    int32_t
    cast_type_desc() const
    {
        return get<Column::CastTypeDesc>();
    }
    int32_t
    im_bonus_ui() const
    {
        return get<Column::ImBonusUi>();
    }
    int32_t
    life_bonus_ui() const
    {
        return get<Column::LifeBonusUi>();
    }
    int32_t
    armor_bonus_ui() const
    {
        return get<Column::ArmorBonusUi>();
    }
    int32_t
    damage_ui() const
    {
        return get<Column::DamageUi>();
    }
    bool
    hide_icon() const
    {
        return get<Column::HideIcon>();
    }
    bool
    localize() const
    {
        return get<Column::Localize>();
    }
    Latin1Str
    gate_version() const
    {
        return get<Column::GateVersion>();
    }
    int32_t
    cancel_type() const
    {
        return get<Column::CancelType>();
    }
};

using SkillBehaviorTable = TypedTable<SkillBehaviorRow>;

}  // namespace cdb::typed
