#pragma once

#include <memory>

#include "command/command.hpp"
#include "query/entity_store.hpp"

namespace commands {

/**
 * @type: command
 * @command: db:cleanup
 * @risk: medium (explicit confirmation)
 * @args: [tables:"select", days:"text", dry_run:"checkbox"]
 * @description: Remove stale records (older than `days`, by created_at) from a maintenance table
 */
class DatabaseCleanupCommand : public command::Command {
public:
    static constexpr const char* kName = "db:cleanup";

    explicit DatabaseCleanupCommand(std::shared_ptr<query::EntityStore> store);

    command::CommandOutput execute(const command::OptionValues& values,
                                   const command::ExecutionContext& context) override;

private:
    static command::CommandDescriptor describe();

    std::shared_ptr<query::EntityStore> store_;

    inline static constexpr const char* LOG_TAG = "DatabaseCleanupCommand";
};

} // namespace commands
