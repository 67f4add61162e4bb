#include "cdb/tools/arg-options.h"
#include "cdb/core/logger.h"

#include <array>
#include <boost/program_options.hpp>
#include <sstream>
#include <string>
#include <utility>

namespace po = boost::program_options;
namespace cdb::tools {

namespace {
// Options that take an id and select a query
constexpr std::array<std::pair<const char*, QueryKind>, 7> KEYED_QUERIES{{
    {"icon", QueryKind::Icon},
    {"mission", QueryKind::Mission},
    {"tasks", QueryKind::Tasks},
    {"object", QueryKind::Object},
    {"render", QueryKind::Render},
    {"components", QueryKind::Components},
    {"skill", QueryKind::Skill},
}};
}  // namespace

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "fdb", po::value<std::string>(), "Path to the CDClient.fdb file")(
        "log-level",
        po::value<std::string>(),
        "Log level (error, warn, info, debug). Defaults to $CDB_LOG_LEVEL, "
        "then error")(
        "json", po::bool_switch(), "Print results as JSON");

    po::options_description queries("Queries (exactly one)");
    queries.add_options()(
        "icon", po::value<int32_t>(), "Icon path of an icon id")(
        "mission", po::value<int32_t>(), "Summary of a mission id")(
        "tasks", po::value<int32_t>(), "Tasks of a mission id")(
        "object", po::value<int32_t>(), "Title and description of an object")(
        "render", po::value<int32_t>(), "Icon asset of a render component")(
        "components", po::value<int32_t>(), "Components of an object")(
        "skill", po::value<int32_t>(), "SkillBehavior row of a skill id")(
        "table",
        po::value<std::string>(),
        "Raw rows of any table whose first field equals --key")(
        "key", po::value<int32_t>(), "Key for --table")(
        "list-tables", po::bool_switch(), "List the tables in the file");
    desc.add(queries);

    po::positional_options_description pos_desc;
    pos_desc.add("fdb", 1);

    std::ostringstream help_stream;
    help_stream << "CDClient Query Tool" << std::endl
                << "-------------------" << std::endl
                << "Typed lookups against a CDClient.fdb client database"
                << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "cdb-query")
                << " [options] <fdb_file>" << std::endl
                << desc << std::endl
                << "Examples:" << std::endl
                << "  cdb-query CDClient.fdb --object 1727" << std::endl
                << "  cdb-query CDClient.fdb --tasks 173 --json" << std::endl
                << "  cdb-query CDClient.fdb --table Icons --key 42"
                << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(pos_desc)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("fdb"))
        {
            options.fdb_file = vm["fdb"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message = "No fdb file specified";
            return options;
        }

        if (vm.count("log-level"))
        {
            auto level = vm["log-level"].as<std::string>();
            if (!Logger::parse_level(level))
            {
                options.valid = false;
                options.error_message = "Unknown log level: " + level;
                return options;
            }
            options.log_level = level;
        }

        options.json = vm["json"].as<bool>();

        int selected = 0;
        for (const auto& [name, kind] : KEYED_QUERIES)
        {
            if (vm.count(name))
            {
                options.query = kind;
                options.key = vm[name].as<int32_t>();
                ++selected;
            }
        }
        if (vm.count("table"))
        {
            options.query = QueryKind::Table;
            options.table_name = vm["table"].as<std::string>();
            ++selected;
            if (!vm.count("key"))
            {
                options.valid = false;
                options.error_message = "--table requires --key";
                return options;
            }
            options.key = vm["key"].as<int32_t>();
        }
        else if (vm.count("key"))
        {
            options.valid = false;
            options.error_message = "--key is only valid with --table";
            return options;
        }
        if (vm["list-tables"].as<bool>())
        {
            options.query = QueryKind::ListTables;
            ++selected;
        }

        if (selected != 1)
        {
            options.valid = false;
            options.error_message = selected == 0
                ? "No query specified"
                : "Only one query may be given at a time";
            options.query = QueryKind::None;
            return options;
        }
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

}  // namespace cdb::tools
