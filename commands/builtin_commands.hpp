#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "command/command.hpp"
#include "query/entity_store.hpp"

namespace commands {

using CommandFactory = std::function<command::CommandHandle(const std::shared_ptr<query::EntityStore>&)>;

// Built-in commands by name.
const std::map<std::string, CommandFactory>& builtinCommands();

// nullptr when no built-in has that name
command::CommandHandle makeBuiltin(const std::string& name, const std::shared_ptr<query::EntityStore>& store);

} // namespace commands
