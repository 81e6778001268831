#include <iostream>

#include "cmdschema/cli/root_command.hpp"

int main(int argc, char* argv[]) {
    try {
        auto root_cmd = cmdschema::cli::RootCommand::create();
        return root_cmd->execute(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 4;
    }
}
