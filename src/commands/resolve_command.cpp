#include "cmdschema/commands/resolve_command.hpp"

#include <iostream>

#include "cmdschema/catalog/catalog.hpp"
#include "cmdschema/commands/command_support.hpp"
#include "cmdschema/log/logger.hpp"
#include "cmdschema/resolver/resolver.hpp"
#include "cmdschema/serialization/json_report.hpp"

namespace cmdschema::commands {

ResolveCommand::ResolveCommand()
    : cmdschema::cli::Command("resolve",
                              "Resolve one invocation against a catalog") {
    add_catalog_flags(*this);
    set_long_description(
        "Binds the tokens after '--' to the named command, applies defaults "
        "and type coercion, and prints the resulting invocation as JSON. "
        "Exits with 1 when the invocation is rejected.")
        .set_usage("cmdschema resolve [OPTIONS] -- <COMMAND> [ARGS...]")
        .set_example(
            "  cmdschema resolve --root ./plugin -- build --platform ios\\n"
            "  cmdschema resolve -r ./plugin -- test --coverage");
}

int ResolveCommand::run(cmdschema::cli::CommandContext& ctx) {
    if (ctx.args().empty()) {
        std::cerr << "Error: no command to resolve" << std::endl;
        print_usage();
        return EXIT_USAGE_ERROR;
    }

    catalog::CatalogConfig config;
    try {
        config = prepare_catalog_config(ctx);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE_ERROR;
    }

    const catalog::CatalogLoadResult loaded = catalog::Catalog(config).load();
    if (!loaded.ok()) {
        print_json(serialization::load_result_to_json(loaded), ctx);
        return EXIT_LOAD_ERROR;
    }

    resolver::Resolver resolver(loaded.registry);
    const resolver::ResolveResult result =
        resolver.try_resolve_tokens(ctx.args());
    if (!result) {
        CMDSCHEMA_LOG_INFO << "Rejected invocation: " << result.error().what();
        print_json({{"ok", false},
                    {"error", serialization::error_to_json(result.error())}},
                   ctx);
        return EXIT_INVOCATION_ERROR;
    }

    CMDSCHEMA_LOG_DEBUG << "Resolved invocation of '"
                        << result.context().command() << "'";
    print_json({{"ok", true},
                {"invocation",
                 serialization::context_to_json(result.context())}},
               ctx);
    return EXIT_OK;
}

}  // namespace cmdschema::commands
