#include "cmdschema/commands/command_support.hpp"

#include <iostream>
#include <memory>

#include "cmdschema/config/config.hpp"
#include "cmdschema/log/logger.hpp"

namespace cmdschema::commands {

void add_catalog_flags(cli::Command& command) {
    command.add_flag_with_short("config", "c",
                                "Configuration file (YAML, JSON or INI)");
    command.add_flag_with_short("root", "r",
                                "Catalog root directory (overrides config)");
    command.add_bool_flag_with_short("verbose", "v", "Enable debug logging");
    command.add_bool_flag("pretty", "Indent JSON output");
}

catalog::CatalogConfig prepare_catalog_config(const cli::CommandContext& ctx) {
    auto& manager = config::ConfigManager::instance();
    manager.reset();

    auto log_config = std::make_shared<log::LogConfig>();
    auto catalog_config = std::make_shared<catalog::CatalogConfig>();
    manager.register_configuration_properties(log_config);
    manager.register_configuration_properties(catalog_config);

    const std::string config_file = ctx.get_flag("config");
    if (!config_file.empty()) {
        manager.load_config(config_file,
                            config::format_from_path(config_file));
    }

    if (ctx.get_bool_flag("verbose")) {
        log_config->global_level = log::LogConfig::LogLevel::DEBUG;
    }
    log::Logger::init(*log_config);

    catalog::CatalogConfig result = *catalog_config;
    if (ctx.is_user_provided("root")) {
        result.root = ctx.get_flag("root");
    }
    result.validate();
    return result;
}

void print_json(const nlohmann::json& document,
                const cli::CommandContext& ctx) {
    std::cout << document.dump(ctx.get_bool_flag("pretty") ? 2 : -1)
              << std::endl;
}

}  // namespace cmdschema::commands
