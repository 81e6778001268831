#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cmdschema/errors/errors.hpp"
#include "cmdschema/registry/registry.hpp"
#include "cmdschema/resolver/invocation_context.hpp"

namespace cmdschema::resolver {

// An already tokenized invocation. Options keep their order so repeated
// flags can be folded deterministically (the last occurrence wins).
struct RawInvocation {
    std::string command;
    std::vector<std::string> positionals;
    std::vector<std::pair<std::string, std::string>> options;

    RawInvocation& arg(const std::string& token) {
        positionals.push_back(token);
        return *this;
    }
    RawInvocation& option(const std::string& flag, const std::string& value) {
        options.emplace_back(flag, value);
        return *this;
    }
};

// Outcome of try_resolve: exactly one of context() or error() is valid
class ResolveResult {
public:
    static ResolveResult success(InvocationContext context);
    static ResolveResult failure(
        std::unique_ptr<errors::InvocationError> error);

    bool ok() const { return context_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Throws std::logic_error when called on the wrong alternative
    const InvocationContext& context() const;
    const errors::InvocationError& error() const;

private:
    ResolveResult() = default;

    std::optional<InvocationContext> context_;
    std::shared_ptr<const errors::InvocationError> error_;
};

/**
 * @brief Binds raw invocations to the schemas of a finalized Registry.
 *
 * Resolution is a pure function of (registry, invocation): nothing is cached
 * and the registry is only read, so one Resolver may serve many threads.
 * Any failure aborts before an InvocationContext is built.
 */
class Resolver {
public:
    // Throws RegistryStateError if the registry is null or not finalized
    explicit Resolver(std::shared_ptr<const registry::Registry> registry);

    // Throws only errors::InvocationError subclasses
    InvocationContext resolve(const RawInvocation& invocation) const;
    ResolveResult try_resolve(const RawInvocation& invocation) const;

    // argv-style input, argv[0] being the command name.
    //   --flag value | --flag=value   option
    //   --flag                        boolean option set to true
    //   --                            everything after is positional
    InvocationContext resolve_tokens(
        const std::vector<std::string>& argv) const;
    ResolveResult try_resolve_tokens(
        const std::vector<std::string>& argv) const;

    // Schema-aware splitting used by resolve_tokens
    RawInvocation split_tokens(const std::vector<std::string>& argv) const;

    const registry::Registry& registry() const { return *registry_; }

private:
    std::shared_ptr<const registry::Registry> registry_;
};

}  // namespace cmdschema::resolver
