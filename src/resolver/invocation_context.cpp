#include "cmdschema/resolver/invocation_context.hpp"

#include <stdexcept>

namespace cmdschema::resolver {

InvocationContext::InvocationContext(
    std::string command, std::map<std::string, OptionalValue> values,
    std::map<std::string, std::string> raw_options,
    std::set<std::string> user_provided)
    : command_(std::move(command)),
      values_(std::move(values)),
      raw_options_(std::move(raw_options)),
      user_provided_(std::move(user_provided)) {}

bool InvocationContext::is_set(const std::string& name) const {
    auto it = values_.find(name);
    return it != values_.end() && it->second.has_value();
}

const schema::ArgumentValue& InvocationContext::value(
    const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::out_of_range("Command '" + command_ +
                                "' declares no argument '" + name + "'");
    }
    if (!it->second) {
        throw std::out_of_range("Argument '" + name + "' of command '" +
                                command_ + "' is not set");
    }
    return *it->second;
}

const std::string& InvocationContext::get_string(
    const std::string& name) const {
    return std::get<std::string>(value(name));
}

bool InvocationContext::get_bool(const std::string& name) const {
    return std::get<bool>(value(name));
}

std::int64_t InvocationContext::get_int(const std::string& name) const {
    return std::get<std::int64_t>(value(name));
}

const schema::StringList& InvocationContext::get_list(
    const std::string& name) const {
    return std::get<schema::StringList>(value(name));
}

}  // namespace cmdschema::resolver
