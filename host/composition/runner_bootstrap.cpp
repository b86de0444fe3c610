#include "runner_bootstrap.hpp"

#include "commands/builtin_commands.hpp"
#include "commands/discovered_command.hpp"
#include "commands/entity_query_command.hpp"
#include "logging/logging.hpp"

namespace composition {

size_t RunnerBootstrap::registerDefaultCommands(command::CommandRegistry& registry,
                                                const config::RunnerConfig& config,
                                                const std::shared_ptr<query::EntityStore>& store) {
    const std::string name = commands::EntityQueryCommand::kName;
    if (!config.isCommandEnabled(name)) {
        LOG_INFO(LOG_TAG, "default command {} disabled by configuration", name);
        return 0;
    }
    return registry.registerCommands({commands::makeBuiltin(name, store)});
}

size_t RunnerBootstrap::registerConfiguredCommands(command::CommandRegistry& registry,
                                                   const config::RunnerConfig& config,
                                                   const std::shared_ptr<query::EntityStore>& store) {
    std::vector<command::CommandHandle> list;
    for (const auto& [name, enabled] : config.commands) {
        // 비활성 또는 이미 등록된 명령은 건너뜀
        if (!enabled || registry.has(name)) continue;

        auto cmd = commands::makeBuiltin(name, store);
        if (!cmd) {
            LOG_WARN(LOG_TAG, "Failed to register command: {} (unknown command)", name);
            continue;
        }
        list.push_back(std::move(cmd));
    }
    return registry.registerCommands(list);
}

size_t RunnerBootstrap::registerDiscoveredCommands(command::CommandRegistry& registry,
                                                   const config::RunnerConfig& config) {
    const auto& ad = config.auto_discovery;
    if (!ad.enabled) return 0;

    auto found = commands::CommandDiscovery::scan(ad.path);
    if (!ad.default_enabled) {
        for (const auto& [name, info] : found)
            LOG_INFO(LOG_TAG, "discovered {} ({}), not enabled", name, info.source);
        return 0;
    }

    std::vector<command::CommandHandle> list;
    for (const auto& [name, info] : found) {
        if (registry.has(name) || !config.isCommandEnabled(name)) continue;
        list.push_back(std::make_shared<commands::DiscoveredCommand>(info, ad.default_risk));
    }
    return registry.registerCommands(list);
}

size_t RunnerBootstrap::populate(command::CommandRegistry& registry,
                                 const config::RunnerConfig& config,
                                 const std::shared_ptr<query::EntityStore>& store) {
    size_t count = registerDefaultCommands(registry, config, store);
    count += registerConfiguredCommands(registry, config, store);
    count += registerDiscoveredCommands(registry, config);
    LOG_INFO(LOG_TAG, "{} command(s) registered", count);
    return count;
}

} // namespace composition
