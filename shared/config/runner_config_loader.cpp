#include "runner_config_loader.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "common/string_helper.hpp"
#include "logging/logging.hpp"

namespace config {

namespace {

std::string resolvePath(const std::string& base_dir, const std::string& path) {
    if (path.empty() || base_dir.empty()) return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

Result<command::RiskLevel> riskLevel(const std::string& text) {
    auto level = command::parseRiskLevel(toLower(trim(text)));
    if (!level)
        return Result<command::RiskLevel>::Error(ResultCode::InvalidArgument,
                                                 fmt::format("unknown danger level '{}'", text));
    return Result<command::RiskLevel>::OK(*level);
}

} // namespace

Result<RunnerConfig> RunnerConfigLoader::loadFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG_ERROR(LOG_TAG, "failed to load {}: {}", path, e.what());
        return Result<RunnerConfig>::Error(ResultCode::InvalidArgument,
                                           fmt::format("{}: {}", path, e.what()));
    }
    return load(root, std::filesystem::path(path).parent_path().string());
}

Result<RunnerConfig> RunnerConfigLoader::load(const YAML::Node& root, const std::string& base_dir) {
    RunnerConfig c;
    if (!root || root.IsNull()) return Result<RunnerConfig>::OK(c);

    try {
        // ---------------------------
        // 전역 설정
        // ---------------------------
        c.enabled = root["enabled"].as<bool>(c.enabled);
        c.environment = root["environment"].as<std::string>(c.environment);
        c.max_execution_time = root["max_execution_time"].as<int>(c.max_execution_time);
        c.log_executions = root["log_executions"].as<bool>(c.log_executions);
        c.require_confirmation_for_production =
            root["require_confirmation_for_production"].as<bool>(c.require_confirmation_for_production);
        c.entities = resolvePath(base_dir, root["entities"].as<std::string>(""));
        c.logging = resolvePath(base_dir, root["logging"].as<std::string>(""));

        if (c.max_execution_time <= 0)
            return Result<RunnerConfig>::Error(ResultCode::InvalidArgument, "max_execution_time must be positive");

        // ---------------------------
        // commands: name -> bool | {enabled: bool}
        // ---------------------------
        if (root["commands"]) {
            for (const auto& it : root["commands"]) {
                const auto name = it.first.as<std::string>();
                if (it.second.IsMap()) c.commands[name] = it.second["enabled"].as<bool>(true);
                else c.commands[name] = it.second.as<bool>(true);
            }
        }

        // ---------------------------
        // auto discovery
        // ---------------------------
        if (auto ad = root["auto_discovery"]) {
            c.auto_discovery.enabled = ad["enabled"].as<bool>(false);
            c.auto_discovery.default_enabled = ad["default_enabled"].as<bool>(false);
            c.auto_discovery.path = resolvePath(base_dir, ad["path"].as<std::string>(""));
            if (ad["default_security_level"]) {
                auto level = riskLevel(ad["default_security_level"].as<std::string>());
                if (!level) return Result<RunnerConfig>::Error(level.code(), level.error());
                c.auto_discovery.default_risk = level.value();
            }
        }

        // ---------------------------
        // environment restrictions
        // ---------------------------
        if (root["environment_restrictions"]) {
            for (const auto& it : root["environment_restrictions"]) {
                policy::EnvironmentRestriction r;
                for (const auto& l : it.second["allowed_danger_levels"]) {
                    auto level = riskLevel(l.as<std::string>());
                    if (!level) return Result<RunnerConfig>::Error(level.code(), level.error());
                    r.allowed_risk_levels.insert(level.value());
                }
                r.disable_unless_confirmed = it.second["disable_unless_confirmed"].as<bool>(false);
                c.environment_restrictions[it.first.as<std::string>()] = std::move(r);
            }
        }

        // ---------------------------
        // server
        // ---------------------------
        if (auto s = root["server"]) {
            c.server.endpoint = s["endpoint"].as<std::string>(c.server.endpoint);
            c.server.audit_endpoint = s["audit_endpoint"].as<std::string>(c.server.audit_endpoint);
        }
    } catch (const YAML::Exception& e) {
        return Result<RunnerConfig>::Error(ResultCode::InvalidArgument,
                                           fmt::format("invalid configuration: {}", e.what()));
    }

    LOG_DEBUG(LOG_TAG, "configuration loaded (environment={}, enabled={})", c.environment, c.enabled);
    return Result<RunnerConfig>::OK(std::move(c));
}

} // namespace config
