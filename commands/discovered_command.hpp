#pragma once

#include <map>
#include <string>

#include "command/command.hpp"

namespace commands {

// One command manifest found by auto-discovery.
struct DiscoveredCommandInfo {
    std::string name;          // first word of the signature
    std::string signature;     // e.g. "report:daily {--date=}"
    std::string description;
    std::string source;        // manifest file
};

/**
 * Scans a directory for command manifests (*.yaml / *.yml):
 *
 *   signature: "report:daily {--date=}"
 *   description: Build the daily report
 *
 * Files without both keys, or that fail to parse, are skipped.
 */
class CommandDiscovery {
public:
    // keyed and ordered by command name
    static std::map<std::string, DiscoveredCommandInfo> scan(const std::string& directory);

private:
    inline static constexpr const char* LOG_TAG = "CommandDiscovery";
};

/**
 * @type: command
 * @command: <discovered>
 * @risk: auto_discovery.default_security_level
 * @description: Stands in for a discovered console command; execution echoes its signature
 */
class DiscoveredCommand : public command::Command {
public:
    DiscoveredCommand(const DiscoveredCommandInfo& info, command::RiskLevel risk);

    command::CommandOutput execute(const command::OptionValues& values,
                                   const command::ExecutionContext& context) override;

    const std::string& signature() const noexcept { return signature_; }

private:
    static command::CommandDescriptor describe(const DiscoveredCommandInfo& info, command::RiskLevel risk);

    std::string signature_;
};

} // namespace commands
