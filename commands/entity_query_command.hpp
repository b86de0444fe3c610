#pragma once

#include <memory>

#include "command/command.hpp"
#include "query/entity_store.hpp"

namespace commands {

/**
 * @type: command
 * @command: entity:query
 * @risk: low
 * @args: [entity:"select", query:"textarea"]
 * @description: Run read-only queries against an entity type for data exploration
 */
class EntityQueryCommand : public command::Command {
public:
    static constexpr const char* kName = "entity:query";

    explicit EntityQueryCommand(std::shared_ptr<const query::EntitySource> source);

    // base pass, then: entity type known, query passes the sandbox check
    Result<void, command::ValidationError> validateOptions(const command::OptionValues& values) const override;

    command::CommandOutput execute(const command::OptionValues& values,
                                   const command::ExecutionContext& context) override;

private:
    static command::CommandDescriptor describe(std::shared_ptr<const query::EntitySource> source);

    std::shared_ptr<const query::EntitySource> source_;

    inline static constexpr const char* LOG_TAG = "EntityQueryCommand";
};

} // namespace commands
