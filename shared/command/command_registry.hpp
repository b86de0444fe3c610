#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/result.h"
#include "command.hpp"

namespace command {

/**
 * Catalog of executable commands keyed by name.
 *
 * Filled once by the composition root during startup and read afterwards;
 * concurrent registration while requests are served is not supported.
 */
class CommandRegistry {
public:
    // Insert or overwrite by name. A malformed command is rejected and leaves
    // existing entries untouched.
    Result<void> registerCommand(CommandHandle cmd);

    // Registers each command; failures are logged and skipped.
    // Returns the number of commands registered.
    size_t registerCommands(const std::vector<CommandHandle>& list);

    CommandHandle get(const std::string& name) const;
    bool has(const std::string& name) const { return commands_.count(name) > 0; }
    size_t size() const noexcept { return commands_.size(); }

    // registration order
    std::vector<CommandHandle> all() const;

    std::map<std::string, std::vector<CommandHandle>> groupByCategory() const;
    std::vector<CommandHandle> filterByRisk(RiskLevel level) const;
    std::vector<CommandHandle> requiringConfirmation() const;

    nlohmann::ordered_json toConfig() const;

    // tests only
    void reset();

    static Result<void> checkDescriptor(const CommandDescriptor& d);

private:
    std::unordered_map<std::string, CommandHandle> commands_;
    std::vector<std::string> order_;

    inline static constexpr const char* LOG_TAG = "CommandRegistry";
};

} // namespace command
