#include "cmdschema/catalog/catalog_config.hpp"

#include <stdexcept>

namespace cmdschema::catalog {

void CatalogConfig::from_ptree(const boost::property_tree::ptree& pt) {
    root = get_value(pt, "root", root);
    commands_dir = get_value(pt, "commands_dir", commands_dir);
    skills_dir = get_value(pt, "skills_dir", skills_dir);
    agents_dir = get_value(pt, "agents_dir", agents_dir);
    if (pt.get_child_optional("extra_agents")) {
        load_vector(pt, "extra_agents", extra_agents);
    }
    skip_invalid = get_value(pt, "skip_invalid", skip_invalid);
}

void CatalogConfig::validate() const {
    if (root.empty()) {
        throw std::invalid_argument("Catalog root cannot be empty");
    }
    if (commands_dir.empty() && skills_dir.empty()) {
        throw std::invalid_argument(
            "Catalog needs at least one of commands_dir or skills_dir");
    }
    for (const auto& agent : extra_agents) {
        if (agent.empty()) {
            throw std::invalid_argument("Catalog extra_agents contains an "
                                        "empty name");
        }
    }
}

}  // namespace cmdschema::catalog
