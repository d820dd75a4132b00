/**
 * @file config.hpp
 * @brief Command line configuration for the migrate_tool operator utility
 */

#ifndef MIGRATE_TOOL_CONFIG_HPP
#define MIGRATE_TOOL_CONFIG_HPP

#include <migrate/engine/engine_config.hpp>

#include <optional>
#include <string>

namespace migrate::tool {

/**
 * @brief Commands supported by the tool
 */
enum class command_type {
    tags,       ///< List every committed ledger tag
    has_tag,    ///< Check one tag for a scope
    snapshots,  ///< List snapshots left captured by interrupted runs
    restore     ///< Restore one pending snapshot
};

/**
 * @brief Complete tool configuration
 */
struct tool_config {
    command_type command{command_type::tags};

    /// Tag id (has-tag) or snapshot id (restore)
    std::string argument;

    /// Tenant for has-tag; empty means the global scope
    std::string tenant;

    /// Database paths and logging
    engine::engine_config engine;

    /**
     * @brief Parse command line arguments
     *
     * Prints usage and returns std::nullopt on --help or invalid input.
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[])
        -> std::optional<tool_config>;

    static void print_help();
};

}  // namespace migrate::tool

#endif  // MIGRATE_TOOL_CONFIG_HPP
