/**
 * @file config.cpp
 * @brief Command line parsing for migrate_tool
 */

#include "config.hpp"

#include <iostream>
#include <string_view>

namespace migrate::tool {

void tool_config::print_help() {
    std::cout << R"(
Migration Ledger Tool

Usage: migrate_tool <command> [arguments] [options]

Commands:
  tags                      List every committed migration tag
  has-tag <tag-id>          Check whether a tag is committed
  snapshots                 List snapshots left by cancelled or interrupted runs
  restore <snapshot-id>     Restore a pending snapshot into the record store

Options:
  --tenant <id>             Scope for has-tag (default: global)
  --ledger-db <path>        Ledger database (default: migrate_ledger.db)
  --snapshot-db <path>      Snapshot database (default: migrate_ledger.db)
  --store-db <path>         Record store database (default: migrate_store.db)
  --log-level <level>       trace, debug, info, warn, error, fatal, off (default: warn)
  --help, -h                Show this help message

Exit Codes:
  0  Success (has-tag: tag committed)
  1  Invalid arguments, or has-tag: tag not committed
  2  Database or restore error
)";
}

auto tool_config::parse_args(int argc, char* argv[]) -> std::optional<tool_config> {
    tool_config config;
    config.engine.logging.min_level = integration::log_level::warn;
    config.engine.logging.enable_file = false;
    config.engine.logging.enable_audit_log = false;

    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--tenant") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --tenant requires a value\n";
                return std::nullopt;
            }
            config.tenant = argv[++i];
            continue;
        }

        if (arg == "--ledger-db") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --ledger-db requires a value\n";
                return std::nullopt;
            }
            config.engine.ledger_db_path = argv[++i];
            continue;
        }

        if (arg == "--snapshot-db") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --snapshot-db requires a value\n";
                return std::nullopt;
            }
            config.engine.snapshot_db_path = argv[++i];
            continue;
        }

        if (arg == "--store-db") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --store-db requires a value\n";
                return std::nullopt;
            }
            config.engine.store_db_path = argv[++i];
            continue;
        }

        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-level requires a value\n";
                return std::nullopt;
            }
            auto level = integration::log_level_from_string(argv[++i]);
            if (!level) {
                std::cerr << "Error: Invalid log level: " << argv[i] << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal, off\n";
                return std::nullopt;
            }
            config.engine.logging.min_level = *level;
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return std::nullopt;
        }

        if (!have_command) {
            if (arg == "tags") {
                config.command = command_type::tags;
            } else if (arg == "has-tag") {
                config.command = command_type::has_tag;
            } else if (arg == "snapshots") {
                config.command = command_type::snapshots;
            } else if (arg == "restore") {
                config.command = command_type::restore;
            } else {
                std::cerr << "Error: Unknown command '" << arg << "'\n";
                return std::nullopt;
            }
            have_command = true;
            continue;
        }

        if (config.argument.empty()) {
            config.argument = std::string(arg);
            continue;
        }

        std::cerr << "Error: Unexpected argument: " << arg << "\n";
        return std::nullopt;
    }

    if (!have_command) {
        print_help();
        return std::nullopt;
    }

    if ((config.command == command_type::has_tag ||
         config.command == command_type::restore) &&
        config.argument.empty()) {
        std::cerr << "Error: "
                  << (config.command == command_type::has_tag ? "has-tag requires a tag id"
                                                              : "restore requires a snapshot id")
                  << "\n";
        return std::nullopt;
    }

    return config;
}

}  // namespace migrate::tool
