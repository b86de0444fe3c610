#include "builtin_commands.hpp"

#include "database_cleanup_command.hpp"
#include "entity_query_command.hpp"

namespace commands {

const std::map<std::string, CommandFactory>& builtinCommands() {
    static const std::map<std::string, CommandFactory> table = {
        {EntityQueryCommand::kName, [](const std::shared_ptr<query::EntityStore>& store) -> command::CommandHandle {
            return std::make_shared<EntityQueryCommand>(store);
        }},
        {DatabaseCleanupCommand::kName, [](const std::shared_ptr<query::EntityStore>& store) -> command::CommandHandle {
            return std::make_shared<DatabaseCleanupCommand>(store);
        }},
    };
    return table;
}

command::CommandHandle makeBuiltin(const std::string& name, const std::shared_ptr<query::EntityStore>& store) {
    const auto& table = builtinCommands();
    auto it = table.find(name);
    return it == table.end() ? nullptr : it->second(store);
}

} // namespace commands
