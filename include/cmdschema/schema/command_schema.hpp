#pragma once

#include <set>
#include <string>
#include <vector>

#include "cmdschema/schema/argument_spec.hpp"

namespace cmdschema::schema {

class SchemaParser;

// Validated, immutable contract of one invocable command.
// Instances are only produced by SchemaParser::parse.
class CommandSchema {
public:
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::vector<ArgumentSpec>& arguments() const { return arguments_; }
    const std::set<std::string>& agent_refs() const { return agent_refs_; }

    const ArgumentSpec* find_argument(const std::string& name) const;
    const ArgumentSpec* find_option(const std::string& name) const;

    // Positional specs in declaration order
    std::vector<const ArgumentSpec*> positionals() const;
    std::vector<const ArgumentSpec*> options() const;

    bool operator==(const CommandSchema& other) const {
        return name_ == other.name_ && description_ == other.description_ &&
               arguments_ == other.arguments_ &&
               agent_refs_ == other.agent_refs_;
    }
    bool operator!=(const CommandSchema& other) const {
        return !(*this == other);
    }

private:
    friend class SchemaParser;

    CommandSchema(std::string name, std::string description,
                  std::vector<ArgumentSpec> arguments,
                  std::set<std::string> agent_refs)
        : name_(std::move(name)),
          description_(std::move(description)),
          arguments_(std::move(arguments)),
          agent_refs_(std::move(agent_refs)) {}

    std::string name_;
    std::string description_;
    std::vector<ArgumentSpec> arguments_;
    std::set<std::string> agent_refs_;
};

}  // namespace cmdschema::schema
