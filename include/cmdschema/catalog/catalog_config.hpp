#pragma once

#include <string>
#include <vector>

#include "cmdschema/config/config.hpp"

namespace cmdschema::catalog {

// `catalog:` section of the configuration file. Directories are relative
// to `root` unless absolute.
class CatalogConfig
    : public config::ReloadableConfigurationProperties<CatalogConfig> {
public:
    std::string root = ".";
    std::string commands_dir = "commands";
    std::string skills_dir = "skills";
    std::string agents_dir = "agents";
    // Agents provided by the host rather than by agent documents
    std::vector<std::string> extra_agents;
    // Drop unparsable declarations with a warning instead of failing
    bool skip_invalid = false;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "catalog"; }
};

}  // namespace cmdschema::catalog
