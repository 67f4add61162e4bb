#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cdb::tools {

/**
 * The single query a cdb-query invocation runs
 */
enum class QueryKind {
    None,
    Icon,
    Mission,
    Tasks,
    Object,
    Render,
    Components,
    Skill,
    Table,
    ListTables
};

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Path to the CDClient.fdb file */
    std::optional<std::string> fdb_file;

    /** Log level name, if given on the command line */
    std::optional<std::string> log_level;

    QueryKind query = QueryKind::None;

    /** Lookup key of the query; absent only for --list-tables */
    std::optional<int32_t> key;

    /** Table name for --table */
    std::optional<std::string> table_name;

    /** Print results as JSON */
    bool json = false;

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

}  // namespace cdb::tools
