#include "discovered_command.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include "common/string_helper.hpp"
#include "logging/logging.hpp"
#include "output/output_formatter.hpp"

namespace commands {

namespace fs = std::filesystem;
using output::OutputFormatter;

std::map<std::string, DiscoveredCommandInfo> CommandDiscovery::scan(const std::string& directory) {
    std::map<std::string, DiscoveredCommandInfo> found;

    std::error_code ec;
    if (directory.empty() || !fs::is_directory(directory, ec)) {
        LOG_DEBUG(LOG_TAG, "discovery path '{}' is not a directory", directory);
        return found;
    }

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        const auto ext = entry.path().extension().string();
        if (!entry.is_regular_file(ec) || (ext != ".yaml" && ext != ".yml")) continue;

        try {
            YAML::Node root = YAML::LoadFile(entry.path().string());
            if (!root["signature"] || !root["description"]) continue;

            DiscoveredCommandInfo info;
            info.signature = trim(root["signature"].as<std::string>());
            info.description = root["description"].as<std::string>();
            info.name = info.signature.substr(0, info.signature.find(' '));
            info.source = entry.path().string();
            if (info.name.empty()) continue;

            found[info.name] = std::move(info);
        } catch (const YAML::Exception& e) {
            LOG_WARN(LOG_TAG, "skipping {}: {}", entry.path().string(), e.what());
        }
    }

    if (ec) LOG_WARN(LOG_TAG, "scanning {}: {}", directory, ec.message());
    LOG_INFO(LOG_TAG, "{} command manifest(s) discovered in {}", found.size(), directory);
    return found;
}

// ---------------------------------------------------------------------------
// DiscoveredCommand
// ---------------------------------------------------------------------------

command::CommandDescriptor DiscoveredCommand::describe(const DiscoveredCommandInfo& info,
                                                       command::RiskLevel risk) {
    command::CommandDescriptor d;
    d.name = info.name;
    d.display_name = info.name;
    d.description = info.description;
    d.category = "Discovered";
    d.risk = risk;
    return d;
}

DiscoveredCommand::DiscoveredCommand(const DiscoveredCommandInfo& info, command::RiskLevel risk)
    : Command(describe(info, risk)), signature_(info.signature) {}

command::CommandOutput DiscoveredCommand::execute(const command::OptionValues&,
                                                  const command::ExecutionContext& context) {
    command::CommandOutput result;
    result.output = OutputFormatter::formatExecutionHeader(name(), {}, context.user,
                                                           context.environment, context.started_at);
    result.output += fmt::format("ℹ️ No handler is bound to '{}'.\n", name());
    result.output += fmt::format("Signature: {}\n", signature_);
    result.output += OutputFormatter::formatExecutionFooter(0.0, 0);
    return result;
}

} // namespace commands
