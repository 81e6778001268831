#pragma once
#include <memory>

#include "cmdschema/cli/command.hpp"

namespace cmdschema::cli {

// Root command that manages all subcommands
class RootCommand : public Command {
public:
    RootCommand();

    static std::shared_ptr<RootCommand> create();

    int run(CommandContext& ctx) override;

private:
    void register_commands();
};

}  // namespace cmdschema::cli
