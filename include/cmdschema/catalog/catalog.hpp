#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cmdschema/catalog/catalog_config.hpp"
#include "cmdschema/errors/errors.hpp"
#include "cmdschema/registry/registry.hpp"

namespace cmdschema::catalog {

// One declaration that could not be turned into a registered schema
struct LoadFailure {
    std::string source;
    errors::ErrorCode code;
    std::string message;
    std::exception_ptr error;
};

struct CatalogLoadResult {
    // Null unless every declaration loaded and every agent reference
    // resolved (failures may be skipped when skip_invalid is set)
    std::shared_ptr<const registry::Registry> registry;
    std::vector<std::string> commands;
    std::set<std::string> agents;
    std::vector<LoadFailure> failures;
    std::vector<errors::DanglingAgentReferenceError> dangling;
    size_t skipped = 0;

    bool ok() const { return registry != nullptr; }
};

/**
 * @brief Builds a Registry from a plugin directory.
 *
 * Reads agent documents first to obtain the known-agent set, then every
 * command and skill declaration, and finally runs the registry's
 * cross-reference validation. All problems are collected in one pass.
 */
class Catalog {
public:
    explicit Catalog(CatalogConfig config);

    CatalogLoadResult load() const;

    // Rethrows the first per-file failure, or a RegistryValidationError
    std::shared_ptr<const registry::Registry> load_or_throw() const;

    std::filesystem::path resolve_dir(const std::string& dir) const;

    const CatalogConfig& config() const { return config_; }

private:
    std::set<std::string> load_agents(CatalogLoadResult& result) const;
    void load_declarations(const std::filesystem::path& dir,
                           registry::Registry& registry,
                           CatalogLoadResult& result) const;

    CatalogConfig config_;
};

}  // namespace cmdschema::catalog
