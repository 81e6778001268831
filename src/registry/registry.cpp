#include "cmdschema/registry/registry.hpp"

#include <algorithm>

namespace cmdschema::registry {

std::string registry_state_to_string(Registry::State state) {
    switch (state) {
        case Registry::State::Loading:
            return "loading";
        case Registry::State::Finalized:
            return "finalized";
        case Registry::State::Failed:
            return "failed";
    }
    return "unknown";
}

void Registry::register_schema(schema::CommandSchema schema) {
    if (state_ != State::Loading) {
        throw errors::RegistryStateError(
            "Cannot register '" + schema.name() + "' in a " +
            registry_state_to_string(state_) + " registry");
    }
    if (schemas_.count(schema.name())) {
        throw errors::DuplicateCommandError(schema.name());
    }
    std::string name = schema.name();
    schemas_.emplace(std::move(name), std::move(schema));
}

std::vector<errors::DanglingAgentReferenceError>
Registry::finalize_and_validate(const std::set<std::string>& known_agents) {
    if (state_ != State::Loading) {
        throw errors::RegistryStateError("Registry already " +
                                         registry_state_to_string(state_));
    }

    std::vector<errors::DanglingAgentReferenceError> dangling;
    for (const auto& [name, schema] : schemas_) {
        for (const auto& agent : schema.agent_refs()) {
            if (!known_agents.count(agent)) {
                dangling.emplace_back(name, agent);
            }
        }
    }
    // schemas_ and agent_refs are both ordered, but keep the contract
    // explicit rather than relying on container iteration order
    std::sort(dangling.begin(), dangling.end());

    known_agents_ = known_agents;
    state_ = dangling.empty() ? State::Finalized : State::Failed;
    return dangling;
}

void Registry::finalize_or_throw(const std::set<std::string>& known_agents) {
    auto dangling = finalize_and_validate(known_agents);
    if (!dangling.empty()) {
        throw errors::RegistryValidationError(std::move(dangling));
    }
}

const schema::CommandSchema& Registry::lookup(const std::string& name) const {
    if (state_ != State::Finalized) {
        throw errors::RegistryStateError("Lookup of '" + name + "' in a " +
                                         registry_state_to_string(state_) +
                                         " registry");
    }
    auto it = schemas_.find(name);
    if (it == schemas_.end()) {
        throw errors::UnknownCommandError(name);
    }
    return it->second;
}

std::vector<std::string> Registry::command_names() const {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& [name, schema] : schemas_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace cmdschema::registry
