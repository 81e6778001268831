#pragma once
#include "cmdschema/cli/command.hpp"

namespace cmdschema::commands {

class ListCommand : public cmdschema::cli::Command {
public:
    ListCommand();
    int run(cmdschema::cli::CommandContext& ctx) override;
};

}  // namespace cmdschema::commands
