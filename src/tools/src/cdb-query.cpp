#include "cdb/core/logger.h"
#include "cdb/fdb/fdb-errors.h"
#include "cdb/fdb/fdb-mmap-reader.h"
#include "cdb/tools/arg-options.h"
#include "cdb/typed-json/pretty-print.h"
#include "cdb/typed-json/row-json.h"
#include "cdb/typed/lookup.h"
#include "cdb/typed/typed-database.h"
#include "cdb/typed/typed-errors.h"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace cdb;
using namespace cdb::tools;
using namespace cdb::typed;

namespace {

template <typename T>
void
print_value(std::ostream& os, const T& value)
{
    os << value;
}

void
print_value(std::ostream& os, bool value)
{
    os << (value ? "true" : "false");
}

template <typename T>
void
print_value(std::ostream& os, const std::optional<T>& value)
{
    if (value)
    {
        print_value(os, *value);
    }
    else
    {
        os << "null";
    }
}

template <typename RowT>
void
print_row(const RowT& row)
{
    row.visit_columns([](const ColumnSpec& spec, const auto& value) {
        std::cout << "  " << spec.name << ": ";
        print_value(std::cout, value);
        std::cout << std::endl;
    });
}

void
not_found(const char* what, int32_t key)
{
    std::cout << what << " #" << key << " not found" << std::endl;
}

int
list_tables(const fdb::Database& db)
{
    for (const auto& table : db.tables())
    {
        std::cout << table.name() << " (" << table.column_count()
                  << " columns, " << table.bucket_count() << " buckets)"
                  << std::endl;
    }
    return 0;
}

// Raw rows of the key's bucket whose first field is the key
int
dump_table(const fdb::Database& db, const std::string& name, int32_t key)
{
    auto table = db.table_by_name(name);
    if (!table)
    {
        std::cerr << "Error: no table named '" << name << "'" << std::endl;
        return 1;
    }

    auto bucket = bucket_for_key(*table, key);
    size_t found = 0;
    if (bucket)
    {
        for (auto row : bucket->rows())
        {
            if (!field_equals(row, 0, key))
            {
                continue;
            }
            ++found;
            std::cout << name << " row " << found << ":" << std::endl;
            for (size_t i = 0; i < row.field_count(); ++i)
            {
                auto field = row.field_at(i);
                std::cout << "  "
                          << (i < table->column_count()
                                  ? table->column_at(i).name.decode()
                                  : "#" + std::to_string(i))
                          << ": ";
                if (field)
                {
                    std::cout << *field;
                }
                std::cout << std::endl;
            }
        }
    }
    if (found == 0)
    {
        not_found(name.c_str(), key);
    }
    return 0;
}

int
run_typed_query(const CommandLineOptions& options, const fdb::Database& db)
{
    TypedDatabase tdb(db);
    const int32_t key = *options.key;
    const bool as_json = options.json;

    switch (options.query)
    {
        case QueryKind::Icon: {
            auto path = tdb.get_icon_path(key);
            if (!path)
            {
                not_found("Icon", key);
            }
            else if (as_json)
            {
                json::pretty_print(
                    std::cout, boost::json::value(path->decode()));
            }
            else
            {
                std::cout << *path << std::endl;
            }
            break;
        }
        case QueryKind::Mission: {
            auto mission = tdb.get_mission_data(key);
            if (!mission)
            {
                not_found("Mission", key);
            }
            else if (as_json)
            {
                json::pretty_print(std::cout, json::to_json(*mission));
            }
            else
            {
                std::cout << "mission_icon_id: ";
                print_value(std::cout, mission->mission_icon_id);
                std::cout << std::endl << "is_mission: ";
                print_value(std::cout, mission->is_mission);
                std::cout << std::endl;
            }
            break;
        }
        case QueryKind::Tasks: {
            auto tasks = tdb.get_mission_tasks(key);
            if (as_json)
            {
                json::pretty_print(std::cout, json::to_json(tasks));
                break;
            }
            if (tasks.empty())
            {
                not_found("Mission tasks of", key);
            }
            for (const auto& task : tasks)
            {
                std::cout << "uid: " << task.uid << ", icon_id: ";
                print_value(std::cout, task.icon_id);
                std::cout << std::endl;
            }
            break;
        }
        case QueryKind::Object: {
            auto text = tdb.get_object_name_desc(key);
            if (!text)
            {
                not_found("Object", key);
            }
            else if (as_json)
            {
                boost::json::object obj;
                obj["title"] = text->first;
                obj["description"] = text->second;
                json::pretty_print(std::cout, obj);
            }
            else
            {
                std::cout << text->first << std::endl
                          << text->second << std::endl;
            }
            break;
        }
        case QueryKind::Render: {
            auto image = tdb.get_render_image(key);
            if (!image)
            {
                not_found("Render component", key);
            }
            else if (as_json)
            {
                json::pretty_print(
                    std::cout, boost::json::value(image->decode()));
            }
            else
            {
                std::cout << *image << std::endl;
            }
            break;
        }
        case QueryKind::Components: {
            auto components = tdb.get_components(key);
            if (as_json)
            {
                json::pretty_print(std::cout, json::to_json(components));
            }
            else
            {
                std::cout << "render: ";
                print_value(std::cout, components.render);
                std::cout << std::endl;
            }
            break;
        }
        case QueryKind::Skill: {
            auto skill = tdb.get_skill_behavior(key);
            if (!skill)
            {
                not_found("Skill", key);
            }
            else if (as_json)
            {
                json::pretty_print(std::cout, json::to_json(*skill));
            }
            else
            {
                std::cout << SkillBehaviorSchema::record_name << ":"
                          << std::endl;
                print_row(*skill);
            }
            break;
        }
        default:
            break;
    }
    return 0;
}

}  // namespace

int
main(int argc, char* argv[])
{
    CommandLineOptions options = parse_argv(argc, argv);

    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    std::optional<std::string> level = options.log_level;
    if (!level)
    {
        if (const char* env = std::getenv("CDB_LOG_LEVEL"))
        {
            level = env;
        }
    }
    if (level && !Logger::set_level(*level))
    {
        LOGW("Ignoring unknown log level '", *level, "'");
    }

    try
    {
        fdb::MmapReader reader(*options.fdb_file);
        const auto& db = reader.database();

        switch (options.query)
        {
            case QueryKind::ListTables:
                return list_tables(db);
            case QueryKind::Table:
                return dump_table(db, *options.table_name, *options.key);
            default:
                return run_typed_query(options, db);
        }
    }
    catch (const SchemaError& e)
    {
        std::cerr << "Schema error: " << e.what() << std::endl;
        return 1;
    }
    catch (const fdb::FdbError& e)
    {
        std::cerr << "Error reading " << *options.fdb_file << ": " << e.what()
                  << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
