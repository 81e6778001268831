#pragma once

#include <nlohmann/json.hpp>

#include "cmdschema/catalog/catalog_config.hpp"
#include "cmdschema/cli/command.hpp"

namespace cmdschema::commands {

// Process exit codes shared by all subcommands
constexpr int EXIT_OK = 0;
constexpr int EXIT_INVOCATION_ERROR = 1;
constexpr int EXIT_LOAD_ERROR = 2;
constexpr int EXIT_USAGE_ERROR = cli::Command::EXIT_USAGE;

// Registers the flags every catalog-reading subcommand understands:
// --config/-c, --root/-r, --verbose/-v, --pretty
void add_catalog_flags(cli::Command& command);

// Loads the configuration file named by --config (if any), initializes
// logging and applies command line overrides. Throws std::runtime_error
// when the configuration cannot be loaded.
catalog::CatalogConfig prepare_catalog_config(const cli::CommandContext& ctx);

void print_json(const nlohmann::json& document,
                const cli::CommandContext& ctx);

}  // namespace cmdschema::commands
