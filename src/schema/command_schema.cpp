#include "cmdschema/schema/command_schema.hpp"

#include <algorithm>

namespace cmdschema::schema {

const ArgumentSpec* CommandSchema::find_argument(
    const std::string& name) const {
    auto it = std::find_if(
        arguments_.begin(), arguments_.end(),
        [&name](const ArgumentSpec& spec) { return spec.name == name; });
    return it != arguments_.end() ? &*it : nullptr;
}

const ArgumentSpec* CommandSchema::find_option(const std::string& name) const {
    const ArgumentSpec* spec = find_argument(name);
    return (spec && spec->is_option()) ? spec : nullptr;
}

std::vector<const ArgumentSpec*> CommandSchema::positionals() const {
    std::vector<const ArgumentSpec*> result;
    for (const auto& spec : arguments_) {
        if (spec.is_positional()) result.push_back(&spec);
    }
    return result;
}

std::vector<const ArgumentSpec*> CommandSchema::options() const {
    std::vector<const ArgumentSpec*> result;
    for (const auto& spec : arguments_) {
        if (spec.is_option()) result.push_back(&spec);
    }
    return result;
}

}  // namespace cmdschema::schema
