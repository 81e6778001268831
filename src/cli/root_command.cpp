#include "cmdschema/cli/root_command.hpp"

#include <iostream>

#include "cmdschema/commands/list_command.hpp"
#include "cmdschema/commands/resolve_command.hpp"
#include "cmdschema/commands/validate_command.hpp"
#include "cmdschema/version.hpp"

namespace cmdschema::cli {

RootCommand::RootCommand()
    : Command("cmdschema", "Command schema registry and invocation resolver") {
    set_long_description(
        "cmdschema loads the command, skill and agent declarations of a "
        "plugin catalog, validates them, and resolves invocations into typed "
        "argument records.")
        .set_usage("cmdschema [GLOBAL_OPTIONS] <COMMAND> [COMMAND_OPTIONS]")
        .set_example(
            "  cmdschema validate --root ./plugin\\n"
            "  cmdschema list --root ./plugin\\n"
            "  cmdschema resolve --root ./plugin -- build --platform ios");

    add_bool_flag("version", "Show version information");

    register_commands();
}

std::shared_ptr<RootCommand> RootCommand::create() {
    return std::make_shared<RootCommand>();
}

void RootCommand::register_commands() {
    add_command(std::make_shared<cmdschema::commands::ValidateCommand>());
    add_command(std::make_shared<cmdschema::commands::ListCommand>());
    add_command(std::make_shared<cmdschema::commands::ResolveCommand>());
}

int RootCommand::run(CommandContext& ctx) {
    if (ctx.get_bool_flag("version")) {
        std::cout << "cmdschema " << CMDSCHEMA_VERSION << std::endl;
        return 0;
    }

    if (!ctx.args().empty()) {
        std::cerr << "Unknown command: " << ctx.arg(0) << std::endl;
        print_usage();
        return EXIT_USAGE;
    }

    print_help();
    return 0;
}

}  // namespace cmdschema::cli
