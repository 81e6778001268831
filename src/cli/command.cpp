#include "cmdschema/cli/command.hpp"

#include <algorithm>
#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>

namespace po = boost::program_options;

namespace cmdschema::cli {

namespace {

// Hidden option collecting positional tokens, including those after "--"
constexpr const char* kArgsOption = "__args";

constexpr int kExitInternal = 4;

}  // namespace

Command::Command(const std::string& name, const std::string& description)
    : name_(name), description_(description) {}

void Command::add_command(std::shared_ptr<Command> cmd) {
    cmd->parent_ = this;
    subcommands_.push_back(cmd);
}

std::shared_ptr<Command> Command::find_command(const std::string& name) {
    auto it = std::find_if(subcommands_.begin(), subcommands_.end(),
                           [&name](const std::shared_ptr<Command>& cmd) {
                               return cmd->name() == name;
                           });
    return it != subcommands_.end() ? *it : nullptr;
}

void Command::add_flag(const std::string& name, const std::string& description,
                       const std::string& default_value) {
    flags_.push_back({name, "", description, default_value, "string"});
}

void Command::add_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description,
                                  const std::string& default_value) {
    flags_.push_back({name, short_name, description, default_value, "string"});
}

void Command::add_bool_flag(const std::string& name,
                            const std::string& description) {
    flags_.push_back({name, "", description, "", "bool"});
}

void Command::add_bool_flag_with_short(const std::string& name,
                                       const std::string& short_name,
                                       const std::string& description) {
    flags_.push_back({name, short_name, description, "", "bool"});
}

int Command::execute(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    if (args.empty()) args.push_back(name_);
    return execute(args);
}

int Command::execute(const std::vector<std::string>& args) {
    try {
        return parse_and_execute(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitInternal;
    }
}

int Command::parse_and_execute(const std::vector<std::string>& args) {
    // Subcommands are dispatched before any flag parsing so that their
    // flags never reach this command's parser
    if (args.size() > 1 && !subcommands_.empty()) {
        if (auto subcmd = find_command(args[1])) {
            return subcmd->parse_and_execute(
                std::vector<std::string>(args.begin() + 1, args.end()));
        }
    }

    po::options_description desc("Options");
    desc.add_options()("help,h", "Show help message");
    for (const auto& flag : flags_) {
        std::string option_spec = flag.name;
        if (!flag.short_name.empty()) {
            option_spec += "," + flag.short_name;
        }
        if (flag.type == "bool") {
            desc.add_options()(option_spec.c_str(), flag.description.c_str());
        } else {
            desc.add_options()(
                option_spec.c_str(),
                po::value<std::string>()->default_value(flag.default_value),
                flag.description.c_str());
        }
    }

    po::options_description hidden;
    hidden.add_options()(kArgsOption,
                         po::value<std::vector<std::string>>());
    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add(kArgsOption, -1);

    po::variables_map vm;
    try {
        const std::vector<std::string> tokens(args.begin() + 1, args.end());
        po::store(po::command_line_parser(tokens)
                      .options(all)
                      .positional(positional)
                      .style(po::command_line_style::unix_style &
                             ~po::command_line_style::allow_guessing)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage();
        return EXIT_USAGE;
    }

    if (vm.count("help")) {
        print_help();
        return 0;
    }

    CommandContext ctx;
    for (const auto& flag : flags_) {
        if (flag.type == "bool") {
            if (vm.count(flag.name)) {
                ctx.set_user_flag(flag.name, "true");
            } else {
                ctx.set_flag(flag.name, "false");
            }
        } else if (vm.count(flag.name) && !vm[flag.name].defaulted()) {
            ctx.set_user_flag(flag.name, vm[flag.name].as<std::string>());
        } else {
            ctx.set_flag(flag.name, flag.default_value);
        }
    }

    if (vm.count(kArgsOption)) {
        for (const auto& arg :
             vm[kArgsOption].as<std::vector<std::string>>()) {
            ctx.add_arg(arg);
        }
    }

    return run(ctx);
}

void Command::print_help() const {
    std::cout << name_ << " - " << description_ << std::endl << std::endl;

    if (!long_description_.empty()) {
        std::cout << long_description_ << std::endl << std::endl;
    }

    print_usage();
    std::cout << std::endl;

    if (!subcommands_.empty()) {
        std::cout << "Available Commands:" << std::endl;
        for (const auto& cmd : subcommands_) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name()
                      << cmd->description() << std::endl;
        }
        std::cout << std::endl;
    }

    if (!flags_.empty()) {
        std::cout << "Flags:" << std::endl;
        for (const auto& flag : flags_) {
            std::cout << "  --" << std::left << std::setw(12) << flag.name;
            if (!flag.short_name.empty()) {
                std::cout << "-" << flag.short_name << ", ";
            } else {
                std::cout << "    ";
            }
            std::cout << flag.description;
            if (!flag.default_value.empty()) {
                std::cout << " (default: " << flag.default_value << ")";
            }
            std::cout << std::endl;
        }
        std::cout << std::endl;
    }

    if (!example_.empty()) {
        std::cout << "Examples:" << std::endl;
        std::string processed_example = example_;
        size_t pos = 0;
        while ((pos = processed_example.find("\\n", pos)) !=
               std::string::npos) {
            processed_example.replace(pos, 2, "\n");
            pos += 1;
        }
        std::cout << processed_example << std::endl << std::endl;
    }

    if (!subcommands_.empty()) {
        std::cout << "Use '" << name_
                  << " <command> --help' for more information about a command."
                  << std::endl;
    }
}

void Command::print_usage() const {
    if (!usage_.empty()) {
        std::cout << "Usage: " << usage_ << std::endl;
        return;
    }
    std::cout << "Usage: " << name_;
    if (!flags_.empty()) {
        std::cout << " [OPTIONS]";
    }
    if (!subcommands_.empty()) {
        std::cout << " <COMMAND>";
    }
    std::cout << std::endl;
}

std::string CommandContext::get_flag(const std::string& name) const {
    auto it = flags_.find(name);
    return it != flags_.end() ? it->second : "";
}

bool CommandContext::get_bool_flag(const std::string& name) const {
    std::string value = get_flag(name);
    return value == "true" || value == "1";
}

}  // namespace cmdschema::cli
