#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "cmdschema/errors/errors.hpp"
#include "cmdschema/schema/command_schema.hpp"

namespace cmdschema::registry {

/**
 * @brief Index of all command schemas of one catalog.
 *
 * Lifecycle: Loading -> (finalize_and_validate) -> Finalized | Failed.
 * Schemas can only be registered while Loading, and lookups are only served
 * once Finalized. A Failed registry stays unusable. After finalization the
 * registry is never written again, so concurrent const access is safe
 * without locking.
 */
class Registry {
public:
    enum class State { Loading, Finalized, Failed };

    Registry() = default;

    // Throws DuplicateCommandError, or RegistryStateError when not Loading
    void register_schema(schema::CommandSchema schema);

    // Checks every agent reference of every schema against `known_agents`
    // and returns all dangling references, sorted by (command, agent).
    // An empty result finalizes the registry; otherwise it becomes Failed.
    std::vector<errors::DanglingAgentReferenceError> finalize_and_validate(
        const std::set<std::string>& known_agents);

    // As finalize_and_validate, throwing RegistryValidationError on failure
    void finalize_or_throw(const std::set<std::string>& known_agents);

    // Throws UnknownCommandError, or RegistryStateError when not Finalized
    const schema::CommandSchema& lookup(const std::string& name) const;

    bool contains(const std::string& name) const {
        return schemas_.count(name) > 0;
    }
    size_t size() const { return schemas_.size(); }
    std::vector<std::string> command_names() const;

    State state() const { return state_; }
    bool is_finalized() const { return state_ == State::Finalized; }
    const std::set<std::string>& known_agents() const { return known_agents_; }

private:
    std::map<std::string, schema::CommandSchema> schemas_;
    std::set<std::string> known_agents_;
    State state_ = State::Loading;
};

std::string registry_state_to_string(Registry::State state);

}  // namespace cmdschema::registry
