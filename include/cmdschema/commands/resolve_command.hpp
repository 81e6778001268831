#pragma once
#include "cmdschema/cli/command.hpp"

namespace cmdschema::commands {

class ResolveCommand : public cmdschema::cli::Command {
public:
    ResolveCommand();
    int run(cmdschema::cli::CommandContext& ctx) override;
};

}  // namespace cmdschema::commands
