#include "cmdschema/commands/list_command.hpp"

#include <iostream>

#include "cmdschema/catalog/catalog.hpp"
#include "cmdschema/commands/command_support.hpp"
#include "cmdschema/serialization/json_report.hpp"

namespace cmdschema::commands {

ListCommand::ListCommand()
    : cmdschema::cli::Command("list", "List the commands of a catalog") {
    add_catalog_flags(*this);
    set_long_description(
        "Prints the argument contract of every registered command as JSON, "
        "or of the named commands only.")
        .set_usage("cmdschema list [OPTIONS] [COMMAND...]")
        .set_example(
            "  cmdschema list --root ./plugin\\n"
            "  cmdschema list --root ./plugin build test");
}

int ListCommand::run(cmdschema::cli::CommandContext& ctx) {
    catalog::CatalogConfig config;
    try {
        config = prepare_catalog_config(ctx);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE_ERROR;
    }

    const catalog::CatalogLoadResult result = catalog::Catalog(config).load();
    if (!result.ok()) {
        print_json(serialization::load_result_to_json(result), ctx);
        return EXIT_LOAD_ERROR;
    }

    const auto& registry = *result.registry;
    std::vector<std::string> names = ctx.args();
    if (names.empty()) names = registry.command_names();

    nlohmann::json commands = nlohmann::json::array();
    for (const auto& name : names) {
        try {
            commands.push_back(
                serialization::schema_to_json(registry.lookup(name)));
        } catch (const errors::UnknownCommandError& e) {
            print_json({{"ok", false},
                        {"error", serialization::error_to_json(e)}},
                       ctx);
            return EXIT_INVOCATION_ERROR;
        }
    }
    print_json({{"ok", true}, {"commands", commands}}, ctx);
    return EXIT_OK;
}

}  // namespace cmdschema::commands
