#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "cmdschema/schema/argument_spec.hpp"

namespace cmdschema::resolver {

// std::nullopt is the explicit "not provided and no default" marker
using OptionalValue = std::optional<schema::ArgumentValue>;

// Typed, validated result of resolving one invocation. Holds an entry for
// every argument the command declares.
class InvocationContext {
public:
    InvocationContext(std::string command,
                      std::map<std::string, OptionalValue> values,
                      std::map<std::string, std::string> raw_options,
                      std::set<std::string> user_provided);

    const std::string& command() const { return command_; }
    const std::map<std::string, OptionalValue>& values() const {
        return values_;
    }
    // Flags exactly as given (last occurrence wins), for audit
    const std::map<std::string, std::string>& raw_options() const {
        return raw_options_;
    }

    bool has_argument(const std::string& name) const {
        return values_.count(name) > 0;
    }
    bool is_set(const std::string& name) const;
    // True if the value came from the invocation rather than a default
    bool is_user_provided(const std::string& name) const {
        return user_provided_.count(name) > 0;
    }

    // Throws std::out_of_range if the argument is undeclared or unset, and
    // std::bad_variant_access if it holds a different type
    const schema::ArgumentValue& value(const std::string& name) const;
    const std::string& get_string(const std::string& name) const;
    bool get_bool(const std::string& name) const;
    std::int64_t get_int(const std::string& name) const;
    const schema::StringList& get_list(const std::string& name) const;

    template <typename T>
    std::optional<T> get_optional(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end() || !it->second) return std::nullopt;
        if (const T* v = std::get_if<T>(&*it->second)) return *v;
        return std::nullopt;
    }

    bool operator==(const InvocationContext& other) const {
        return command_ == other.command_ && values_ == other.values_ &&
               raw_options_ == other.raw_options_ &&
               user_provided_ == other.user_provided_;
    }
    bool operator!=(const InvocationContext& other) const {
        return !(*this == other);
    }

private:
    std::string command_;
    std::map<std::string, OptionalValue> values_;
    std::map<std::string, std::string> raw_options_;
    std::set<std::string> user_provided_;
};

}  // namespace cmdschema::resolver
