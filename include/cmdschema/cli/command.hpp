#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cmdschema::cli {

class CommandContext;

// Base command class (similar to cobra.Command)
class Command : public std::enable_shared_from_this<Command> {
public:
    Command(const std::string& name, const std::string& description);
    virtual ~Command() = default;

    std::string name() const { return name_; }
    std::string description() const { return description_; }
    std::string long_description() const { return long_description_; }
    std::string usage() const { return usage_; }

    // Command hierarchy
    void add_command(std::shared_ptr<Command> cmd);
    std::shared_ptr<Command> find_command(const std::string& name);
    const std::vector<std::shared_ptr<Command>>& subcommands() const {
        return subcommands_;
    }

    // Flags
    void add_flag(const std::string& name, const std::string& description,
                  const std::string& default_value = "");
    void add_flag_with_short(const std::string& name,
                             const std::string& short_name,
                             const std::string& description,
                             const std::string& default_value = "");
    void add_bool_flag(const std::string& name, const std::string& description);
    void add_bool_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description);

    // Returns the process exit code
    virtual int run(CommandContext& ctx) = 0;
    int execute(int argc, char* argv[]);
    int execute(const std::vector<std::string>& args);

    void print_help() const;
    void print_usage() const;

    Command& set_long_description(const std::string& desc) {
        long_description_ = desc;
        return *this;
    }
    Command& set_usage(const std::string& usage) {
        usage_ = usage;
        return *this;
    }
    Command& set_example(const std::string& example) {
        example_ = example;
        return *this;
    }

    // Exit code used for command line usage errors
    static constexpr int EXIT_USAGE = 3;

protected:
    struct Flag {
        std::string name;
        std::string short_name;
        std::string description;
        std::string default_value;
        std::string type;  // "string", "bool"
    };

    std::string name_;
    std::string description_;
    std::string long_description_;
    std::string usage_;
    std::string example_;

    std::vector<std::shared_ptr<Command>> subcommands_;
    std::vector<Flag> flags_;
    Command* parent_ = nullptr;

private:
    // args[0] is this command's name
    int parse_and_execute(const std::vector<std::string>& args);
};

// Parsed flags and positional arguments of one command line
class CommandContext {
public:
    void set_flag(const std::string& name, const std::string& value) {
        flags_[name] = value;
    }
    void set_user_flag(const std::string& name, const std::string& value) {
        flags_[name] = value;
        user_provided_flags_.insert(name);
    }
    std::string get_flag(const std::string& name) const;
    bool get_bool_flag(const std::string& name) const;
    bool has_flag(const std::string& name) const {
        return flags_.count(name) > 0;
    }
    bool is_user_provided(const std::string& name) const {
        return user_provided_flags_.count(name) > 0;
    }

    void add_arg(const std::string& arg) { args_.emplace_back(arg); }
    const std::vector<std::string>& args() const { return args_; }
    std::string arg(size_t index) const {
        return index < args_.size() ? args_[index] : "";
    }

private:
    std::unordered_map<std::string, std::string> flags_;
    std::unordered_set<std::string> user_provided_flags_;
    std::vector<std::string> args_;
};

}  // namespace cmdschema::cli
