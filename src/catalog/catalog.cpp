#include "cmdschema/catalog/catalog.hpp"

#include "cmdschema/loader/declaration_loader.hpp"
#include "cmdschema/log/logger.hpp"
#include "cmdschema/schema/schema_parser.hpp"

namespace fs = std::filesystem;

namespace cmdschema::catalog {

using loader::DeclarationLoader;

namespace {

// Records a failed document; with skip_invalid it is dropped with a warning
void record_failure(const fs::path& path, const errors::LoadError& e,
                    bool skip_invalid, CatalogLoadResult& result) {
    if (skip_invalid) {
        CMDSCHEMA_LOG_WARN << "Skipping " << path.string() << ": " << e.what();
        ++result.skipped;
    } else {
        CMDSCHEMA_LOG_ERROR << e.what();
    }
    result.failures.push_back(
        {path.string(), e.code(), e.what(), std::current_exception()});
}

}  // namespace

Catalog::Catalog(CatalogConfig config) : config_(std::move(config)) {
    config_.validate();
}

fs::path Catalog::resolve_dir(const std::string& dir) const {
    fs::path path(dir);
    if (path.is_absolute()) return path;
    return fs::path(config_.root) / path;
}

std::set<std::string> Catalog::load_agents(CatalogLoadResult& result) const {
    std::set<std::string> agents(config_.extra_agents.begin(),
                                 config_.extra_agents.end());
    if (config_.agents_dir.empty()) return agents;

    const fs::path dir = resolve_dir(config_.agents_dir);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        CMDSCHEMA_LOG_WARN << "Agents directory not found: " << dir.string();
        return agents;
    }

    for (const auto& path : DeclarationLoader::list_declaration_files(dir)) {
        try {
            auto agent = DeclarationLoader::load_agent_file(path);
            if (!agents.insert(agent.name).second) {
                CMDSCHEMA_LOG_WARN << "Agent '" << agent.name
                                   << "' declared more than once, last in "
                                   << agent.source;
            }
        } catch (const errors::LoadError& e) {
            record_failure(path, e, config_.skip_invalid, result);
        }
    }
    CMDSCHEMA_LOG_INFO << "Loaded " << agents.size() << " agent(s) from "
                       << dir.string();
    return agents;
}

void Catalog::load_declarations(const fs::path& dir,
                                registry::Registry& registry,
                                CatalogLoadResult& result) const {
    for (const auto& path : DeclarationLoader::list_declaration_files(dir)) {
        try {
            auto declaration = DeclarationLoader::load_file(path);
            registry.register_schema(schema::SchemaParser::parse(declaration));
            CMDSCHEMA_LOG_DEBUG << "Registered command '" << declaration.name
                                << "' from " << path.string();
        } catch (const errors::LoadError& e) {
            record_failure(path, e, config_.skip_invalid, result);
        }
    }
}

CatalogLoadResult Catalog::load() const {
    CMDSCHEMA_LOG_INFO << "Loading catalog from: " << config_.root;

    CatalogLoadResult result;
    result.agents = load_agents(result);

    auto registry = std::make_shared<registry::Registry>();
    if (!config_.commands_dir.empty()) {
        load_declarations(resolve_dir(config_.commands_dir), *registry,
                          result);
    }
    if (!config_.skills_dir.empty() &&
        config_.skills_dir != config_.commands_dir) {
        load_declarations(resolve_dir(config_.skills_dir), *registry, result);
    }

    result.dangling = registry->finalize_and_validate(result.agents);
    result.commands = registry->command_names();
    for (const auto& err : result.dangling) {
        CMDSCHEMA_LOG_ERROR << err.what();
    }

    const bool files_ok = result.failures.empty() || config_.skip_invalid;
    if (files_ok && registry->is_finalized()) {
        result.registry = registry;
        CMDSCHEMA_LOG_INFO << "Catalog ready: " << result.commands.size()
                           << " command(s), " << result.agents.size()
                           << " agent(s)";
    } else {
        CMDSCHEMA_LOG_ERROR << "Catalog rejected: " << result.failures.size()
                            << " declaration failure(s), "
                            << result.dangling.size()
                            << " dangling agent reference(s)";
    }
    return result;
}

std::shared_ptr<const registry::Registry> Catalog::load_or_throw() const {
    CatalogLoadResult result = load();
    if (result.ok()) return result.registry;

    if (!config_.skip_invalid && !result.failures.empty()) {
        std::rethrow_exception(result.failures.front().error);
    }
    throw errors::RegistryValidationError(std::move(result.dangling));
}

}  // namespace cmdschema::catalog
