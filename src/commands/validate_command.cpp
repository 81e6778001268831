#include "cmdschema/commands/validate_command.hpp"

#include <iostream>

#include "cmdschema/catalog/catalog.hpp"
#include "cmdschema/commands/command_support.hpp"
#include "cmdschema/serialization/json_report.hpp"

namespace cmdschema::commands {

ValidateCommand::ValidateCommand()
    : cmdschema::cli::Command("validate",
                              "Load a catalog and report every problem") {
    add_catalog_flags(*this);
    set_long_description(
        "Parses every command, skill and agent document of a catalog, checks "
        "the declarations and all agent cross-references, and prints a JSON "
        "report. Exits with 2 when the catalog cannot be used.")
        .set_usage("cmdschema validate [OPTIONS]")
        .set_example(
            "  cmdschema validate --root ./plugin\\n"
            "  cmdschema validate --config cmdschema.yaml --pretty");
}

int ValidateCommand::run(cmdschema::cli::CommandContext& ctx) {
    catalog::CatalogConfig config;
    try {
        config = prepare_catalog_config(ctx);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE_ERROR;
    }

    catalog::Catalog catalog(config);
    const catalog::CatalogLoadResult result = catalog.load();
    print_json(serialization::load_result_to_json(result), ctx);
    return result.ok() ? EXIT_OK : EXIT_LOAD_ERROR;
}

}  // namespace cmdschema::commands
