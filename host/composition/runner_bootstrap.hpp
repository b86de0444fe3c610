#pragma once
#include <memory>

#include "command/command_registry.hpp"
#include "config/runner_config.hpp"
#include "query/entity_store.hpp"

namespace composition {

/**
 * Startup registration, in this order:
 *   1. default commands (entity:query) unless disabled in `commands`
 *   2. built-ins enabled in `commands`
 *   3. auto-discovered manifests, when discovery is on and default_enabled is set
 * Each step returns the number of commands it registered.
 */
class RunnerBootstrap {
public:
    static size_t registerDefaultCommands(command::CommandRegistry& registry,
                                          const config::RunnerConfig& config,
                                          const std::shared_ptr<query::EntityStore>& store);

    static size_t registerConfiguredCommands(command::CommandRegistry& registry,
                                             const config::RunnerConfig& config,
                                             const std::shared_ptr<query::EntityStore>& store);

    static size_t registerDiscoveredCommands(command::CommandRegistry& registry,
                                             const config::RunnerConfig& config);

    static size_t populate(command::CommandRegistry& registry,
                          const config::RunnerConfig& config,
                          const std::shared_ptr<query::EntityStore>& store);

private:
    inline static constexpr const char* LOG_TAG = "RunnerBootstrap";
};

} // namespace composition
