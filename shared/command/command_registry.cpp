#include "command_registry.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "logging/logging.hpp"

namespace command {

Result<void> CommandRegistry::checkDescriptor(const CommandDescriptor& d) {
    if (d.name.empty())
        return Error(ResultCode::InvalidCommand, "command name must not be empty");
    if (d.display_name.empty())
        return Error(ResultCode::InvalidCommand, fmt::format("command '{}' has no display name", d.name));

    switch (d.risk) {
        case RiskLevel::Low:
        case RiskLevel::Medium:
        case RiskLevel::High:
            break;
        default:
            return Error(ResultCode::InvalidCommand, fmt::format("command '{}' has an invalid risk level", d.name));
    }

    for (const auto& [key, spec] : d.options) {
        if (key.empty())
            return Error(ResultCode::InvalidCommand, fmt::format("command '{}' has an unnamed option", d.name));
        if (spec.kind == OptionKind::Choice && spec.choices.empty() && !spec.choice_resolver)
            return Error(ResultCode::InvalidCommand,
                         fmt::format("command '{}': choice option '{}' has no choices", d.name, key));
        for (const auto& rule : spec.rules) {
            if ((rule.name == RuleName::Min || rule.name == RuleName::Max) && !rule.arg)
                return Error(ResultCode::InvalidCommand,
                             fmt::format("command '{}': rule '{}' on '{}' needs a bound",
                                         d.name, to_string(rule.name), key));
        }
    }
    return OK();
}

Result<void> CommandRegistry::registerCommand(CommandHandle cmd) {
    if (!cmd) return Error(ResultCode::InvalidCommand, "null command");

    auto r = checkDescriptor(cmd->descriptor());
    if (!r) return r;

    const auto& name = cmd->name();
    auto it = commands_.find(name);
    if (it != commands_.end()) {
        LOGI("command '{}' re-registered", name);
        it->second = std::move(cmd);
        return OK();
    }

    order_.push_back(name);
    commands_.emplace(name, std::move(cmd));
    return OK();
}

size_t CommandRegistry::registerCommands(const std::vector<CommandHandle>& list) {
    size_t count = 0;
    for (const auto& cmd : list) {
        auto r = registerCommand(cmd);
        if (!r) {
            LOGW("command skipped: {}", to_string(r));
            continue;
        }
        ++count;
    }
    return count;
}

CommandHandle CommandRegistry::get(const std::string& name) const {
    auto it = commands_.find(name);
    return (it == commands_.end()) ? nullptr : it->second;
}

std::vector<CommandHandle> CommandRegistry::all() const {
    std::vector<CommandHandle> list;
    list.reserve(order_.size());
    for (const auto& name : order_) list.push_back(commands_.at(name));
    return list;
}

std::map<std::string, std::vector<CommandHandle>> CommandRegistry::groupByCategory() const {
    std::map<std::string, std::vector<CommandHandle>> grouped;
    for (const auto& cmd : all()) grouped[cmd->descriptor().category].push_back(cmd);
    return grouped;
}

std::vector<CommandHandle> CommandRegistry::filterByRisk(RiskLevel level) const {
    auto list = all();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [level](const CommandHandle& c) { return c->descriptor().risk != level; }),
               list.end());
    return list;
}

std::vector<CommandHandle> CommandRegistry::requiringConfirmation() const {
    auto list = all();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [](const CommandHandle& c) { return !c->requiresConfirmation(); }),
               list.end());
    return list;
}

nlohmann::ordered_json CommandRegistry::toConfig() const {
    auto j = nlohmann::ordered_json::object();
    for (const auto& cmd : all()) j[cmd->name()] = cmd->toConfig();
    return j;
}

void CommandRegistry::reset() {
    commands_.clear();
    order_.clear();
}

} // namespace command
