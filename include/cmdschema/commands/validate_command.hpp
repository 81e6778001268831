#pragma once
#include "cmdschema/cli/command.hpp"

namespace cmdschema::commands {

class ValidateCommand : public cmdschema::cli::Command {
public:
    ValidateCommand();
    int run(cmdschema::cli::CommandContext& ctx) override;
};

}  // namespace cmdschema::commands
