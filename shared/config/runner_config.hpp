#pragma once
#include <map>
#include <string>

#include "command/command_def.hpp"
#include "policy/risk_policy.hpp"

namespace config {

// ---------------------------
// 자동 탐색 설정
// ---------------------------
struct AutoDiscoveryConfig {
    bool enabled = false;
    command::RiskLevel default_risk = command::RiskLevel::Medium;  // default_security_level
    bool default_enabled = false;    // discovered commands are listed but not registered
    std::string path;                // directory of command manifests (*.yaml)
};

// ---------------------------
// 데몬 엔드포인트
// ---------------------------
struct ServerConfig {
    std::string endpoint = "tcp://127.0.0.1:5570";        // REP, execution requests
    std::string audit_endpoint = "tcp://127.0.0.1:5571";  // PUB, audit records
};

// ---------------------------
// 전체 설정
// ---------------------------
struct RunnerConfig {
    bool enabled = true;                         // master switch
    std::string environment = "production";
    int max_execution_time = 300;                // seconds, reported only
    bool log_executions = true;                  // emit audit records
    bool require_confirmation_for_production = true;

    std::map<std::string, bool> commands;        // command name -> enabled
    AutoDiscoveryConfig auto_discovery;
    std::map<std::string, policy::EnvironmentRestriction> environment_restrictions;

    std::string entities;                        // entity fixture path
    std::string logging;                         // logging YAML path
    ServerConfig server;

    // Commands not mentioned in `commands` count as enabled.
    bool isCommandEnabled(const std::string& name) const {
        auto it = commands.find(name);
        return it == commands.end() || it->second;
    }

    policy::EnvironmentPolicy environmentPolicy() const {
        return policy::EnvironmentPolicy(environment_restrictions, require_confirmation_for_production);
    }
};

} // namespace config
