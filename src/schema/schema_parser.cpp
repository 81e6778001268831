#include "cmdschema/schema/schema_parser.hpp"

#include <regex>
#include <unordered_set>

#include "cmdschema/errors/errors.hpp"
#include "cmdschema/schema/value_coercion.hpp"

namespace cmdschema::schema {

namespace {

using errors::InvalidSchemaError;
using errors::SchemaErrorKind;

std::vector<std::string> unique_in_order(const std::vector<std::string>& in) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& item : in) {
        if (seen.insert(item).second) out.push_back(item);
    }
    return out;
}

}  // namespace

bool SchemaParser::is_valid_command_name(const std::string& name) {
    static const std::regex pattern("^[a-z][a-z0-9-]*$");
    return std::regex_match(name, pattern);
}

CommandSchema SchemaParser::parse(const RawDeclaration& declaration) {
    const std::string& command = declaration.name;

    // 1. Command name
    if (!is_valid_command_name(command)) {
        throw InvalidSchemaError(SchemaErrorKind::BadName, command,
                                 "command name must match ^[a-z][a-z0-9-]*$");
    }

    // 2. Every argument must be spelled in a way we understand
    std::vector<ArgumentSpec> specs;
    specs.reserve(declaration.arguments.size());
    for (const auto& raw : declaration.arguments) {
        if (raw.name.empty()) {
            throw InvalidSchemaError(SchemaErrorKind::UnknownType, command,
                                     "argument without a name");
        }
        auto type = argument_type_from_string(raw.type);
        if (!type) {
            throw InvalidSchemaError(
                SchemaErrorKind::UnknownType, command,
                "argument '" + raw.name + "' has unknown type '" + raw.type +
                    "'");
        }
        auto kind = argument_kind_from_string(raw.kind);
        if (!kind) {
            throw InvalidSchemaError(
                SchemaErrorKind::UnknownType, command,
                "argument '" + raw.name + "' has unknown kind '" + raw.kind +
                    "'");
        }
        if (raw.variadic && *kind != ArgumentKind::Positional) {
            throw InvalidSchemaError(
                SchemaErrorKind::UnknownType, command,
                "option '" + raw.name + "' cannot be variadic");
        }
        if (raw.variadic && *type != ArgumentType::String &&
            *type != ArgumentType::Choice) {
            throw InvalidSchemaError(
                SchemaErrorKind::UnknownType, command,
                "variadic argument '" + raw.name +
                    "' must be of type string or choice");
        }

        ArgumentSpec spec;
        spec.name = raw.name;
        spec.kind = *kind;
        spec.required = raw.required;
        spec.type = *type;
        if (spec.type == ArgumentType::Choice) {
            spec.choices = unique_in_order(raw.choices);
        }
        spec.description = raw.description;
        spec.variadic = raw.variadic;
        specs.push_back(std::move(spec));
    }

    // 3. Unique argument names
    std::unordered_set<std::string> names;
    for (const auto& spec : specs) {
        if (!names.insert(spec.name).second) {
            throw InvalidSchemaError(SchemaErrorKind::DuplicateArgument,
                                     command,
                                     "argument '" + spec.name +
                                         "' is declared more than once");
        }
    }

    // 4. Choice arguments need choices
    for (const auto& spec : specs) {
        if (spec.type == ArgumentType::Choice && spec.choices.empty()) {
            throw InvalidSchemaError(
                SchemaErrorKind::MissingChoices, command,
                "choice argument '" + spec.name + "' declares no choices");
        }
    }

    // 5. Defaults must type-check
    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& raw_default = declaration.arguments[i].default_value;
        if (!raw_default) continue;

        auto& spec = specs[i];
        if (spec.variadic) {
            throw InvalidSchemaError(
                SchemaErrorKind::DefaultTypeMismatch, command,
                "variadic argument '" + spec.name + "' cannot have a default");
        }
        try {
            spec.default_value = coerce_value(spec, *raw_default);
        } catch (const errors::InvocationError& e) {
            throw InvalidSchemaError(SchemaErrorKind::DefaultTypeMismatch,
                                     command,
                                     "default of '" + spec.name +
                                         "' does not match its type: " +
                                         e.what());
        }
    }

    // 6. Positional ordering
    bool seen_optional = false;
    bool seen_variadic = false;
    for (const auto& spec : specs) {
        if (!spec.is_positional()) continue;
        if (seen_variadic) {
            throw InvalidSchemaError(
                SchemaErrorKind::PositionalOrder, command,
                "positional '" + spec.name + "' follows a variadic positional");
        }
        if (spec.required && seen_optional) {
            throw InvalidSchemaError(
                SchemaErrorKind::PositionalOrder, command,
                "required positional '" + spec.name +
                    "' follows an optional positional");
        }
        if (!spec.required) seen_optional = true;
        if (spec.variadic) seen_variadic = true;
    }

    std::set<std::string> agent_refs(declaration.agents.begin(),
                                     declaration.agents.end());
    return CommandSchema(command, declaration.description, std::move(specs),
                         std::move(agent_refs));
}

}  // namespace cmdschema::schema
