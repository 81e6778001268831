#include "cmdschema/resolver/resolver.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

#include "cmdschema/schema/value_coercion.hpp"

namespace cmdschema::resolver {

using schema::ArgumentSpec;
using schema::ArgumentType;
using schema::CommandSchema;

namespace {

// Raw binding of one argument before coercion
struct Binding {
    const ArgumentSpec* spec = nullptr;
    std::optional<std::string> raw;
    schema::StringList rest;  // variadic tokens
    bool from_invocation = false;
};

bool is_long_flag(const std::string& token) {
    return token.size() > 2 && token.compare(0, 2, "--") == 0;
}

}  // namespace

// ---------------------------------------------------------------------------
// ResolveResult
// ---------------------------------------------------------------------------

ResolveResult ResolveResult::success(InvocationContext context) {
    ResolveResult result;
    result.context_.emplace(std::move(context));
    return result;
}

ResolveResult ResolveResult::failure(
    std::unique_ptr<errors::InvocationError> error) {
    if (!error) {
        throw std::invalid_argument("ResolveResult::failure needs an error");
    }
    ResolveResult result;
    result.error_ = std::move(error);
    return result;
}

const InvocationContext& ResolveResult::context() const {
    if (!context_) {
        throw std::logic_error("ResolveResult holds an error: " +
                               std::string(error_->what()));
    }
    return *context_;
}

const errors::InvocationError& ResolveResult::error() const {
    if (!error_) {
        throw std::logic_error("ResolveResult holds a context, not an error");
    }
    return *error_;
}

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

Resolver::Resolver(std::shared_ptr<const registry::Registry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw errors::RegistryStateError("Resolver needs a registry");
    }
    if (!registry_->is_finalized()) {
        throw errors::RegistryStateError(
            "Resolver needs a finalized registry, got a " +
            registry::registry_state_to_string(registry_->state()) + " one");
    }
}

InvocationContext Resolver::resolve(const RawInvocation& invocation) const {
    const CommandSchema& command_schema =
        registry_->lookup(invocation.command);
    const std::string& command = command_schema.name();

    // Fold repeated flags, last occurrence wins. Unknown flags are kept in
    // the order they were given and rejected once binding and coercion pass.
    std::map<std::string, std::string> raw_options;
    std::vector<std::string> unknown_flags;
    for (const auto& [flag, value] : invocation.options) {
        if (command_schema.find_option(flag)) {
            raw_options[flag] = value;
        } else {
            unknown_flags.push_back(flag);
        }
    }

    std::vector<Binding> bindings;
    bindings.reserve(command_schema.arguments().size());

    // Positionals in declaration order
    size_t next_token = 0;
    const auto& tokens = invocation.positionals;
    for (const ArgumentSpec* spec : command_schema.positionals()) {
        Binding binding;
        binding.spec = spec;
        if (spec->variadic) {
            binding.rest.assign(
                tokens.begin() + static_cast<std::ptrdiff_t>(next_token),
                tokens.end());
            next_token = tokens.size();
            binding.from_invocation = !binding.rest.empty();
            if (spec->required && binding.rest.empty()) {
                throw errors::MissingArgumentError(command, spec->name);
            }
        } else if (next_token < tokens.size()) {
            binding.raw = tokens[next_token++];
            binding.from_invocation = true;
        } else if (spec->required && !spec->default_value) {
            throw errors::MissingArgumentError(command, spec->name);
        }
        bindings.push_back(std::move(binding));
    }
    if (next_token < tokens.size()) {
        throw errors::UnexpectedArgumentError(command, tokens[next_token]);
    }

    // Options
    for (const ArgumentSpec* spec : command_schema.options()) {
        Binding binding;
        binding.spec = spec;
        auto it = raw_options.find(spec->name);
        if (it != raw_options.end()) {
            binding.raw = it->second;
            binding.from_invocation = true;
        } else if (spec->required && !spec->default_value) {
            throw errors::MissingArgumentError(command, spec->name);
        }
        bindings.push_back(std::move(binding));
    }

    // Coercion, in binding order
    std::map<std::string, OptionalValue> values;
    std::set<std::string> user_provided;
    for (const auto& binding : bindings) {
        const ArgumentSpec& spec = *binding.spec;
        OptionalValue value;
        if (spec.variadic) {
            for (const auto& token : binding.rest) {
                schema::coerce_value(spec, token);
            }
            if (binding.from_invocation) value = binding.rest;
        } else if (binding.raw) {
            value = schema::coerce_value(spec, *binding.raw);
        } else if (spec.default_value) {
            value = spec.default_value;
        }
        if (binding.from_invocation) user_provided.insert(spec.name);
        values.emplace(spec.name, std::move(value));
    }

    if (!unknown_flags.empty()) {
        throw errors::UnknownOptionError(command, unknown_flags.front());
    }

    return InvocationContext(command, std::move(values), std::move(raw_options),
                             std::move(user_provided));
}

ResolveResult Resolver::try_resolve(const RawInvocation& invocation) const {
    try {
        return ResolveResult::success(resolve(invocation));
    } catch (const errors::InvocationError& e) {
        return ResolveResult::failure(e.clone());
    }
}

RawInvocation Resolver::split_tokens(
    const std::vector<std::string>& argv) const {
    if (argv.empty()) {
        throw errors::UnknownCommandError("");
    }

    RawInvocation invocation;
    invocation.command = argv[0];
    const CommandSchema& command_schema =
        registry_->lookup(invocation.command);

    // Known value flags whose latest occurrence had no value, in first-seen
    // order. A later occurrence with a value clears the entry.
    std::vector<std::string> valueless;
    auto clear_valueless = [&valueless](const std::string& flag) {
        valueless.erase(std::remove(valueless.begin(), valueless.end(), flag),
                        valueless.end());
    };

    bool options_done = false;
    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string& token = argv[i];
        if (options_done) {
            invocation.positionals.push_back(token);
            continue;
        }
        if (token == "--") {
            options_done = true;
            continue;
        }
        if (!is_long_flag(token)) {
            invocation.positionals.push_back(token);
            continue;
        }

        std::string body = token.substr(2);
        auto eq = body.find('=');
        if (eq != std::string::npos) {
            clear_valueless(body.substr(0, eq));
            invocation.options.emplace_back(body.substr(0, eq),
                                            body.substr(eq + 1));
            continue;
        }

        const ArgumentSpec* spec = command_schema.find_option(body);
        const bool has_value = i + 1 < argv.size() &&
                               !is_long_flag(argv[i + 1]) &&
                               argv[i + 1] != "--";
        if (has_value) {
            clear_valueless(body);
            invocation.options.emplace_back(body, argv[++i]);
        } else if (spec && spec->type == ArgumentType::Boolean) {
            invocation.options.emplace_back(body, "true");
        } else if (spec) {
            if (std::find(valueless.begin(), valueless.end(), body) ==
                valueless.end()) {
                valueless.push_back(body);
            }
        } else {
            // Unknown flag without a value; resolve() reports it
            invocation.options.emplace_back(body, "");
        }
    }
    if (!valueless.empty()) {
        throw errors::MissingArgumentError(command_schema.name(),
                                           valueless.front());
    }
    return invocation;
}

InvocationContext Resolver::resolve_tokens(
    const std::vector<std::string>& argv) const {
    return resolve(split_tokens(argv));
}

ResolveResult Resolver::try_resolve_tokens(
    const std::vector<std::string>& argv) const {
    try {
        return ResolveResult::success(resolve_tokens(argv));
    } catch (const errors::InvocationError& e) {
        return ResolveResult::failure(e.clone());
    }
}

}  // namespace cmdschema::resolver
