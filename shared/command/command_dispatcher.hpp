#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "audit/audit_sink.hpp"
#include "command_registry.hpp"
#include "common/result.h"
#include "config/runner_config.hpp"
#include "policy/risk_policy.hpp"

namespace command {

struct ExecutionRequest {
    std::string command;
    OptionValues options;
    std::string user;
    bool confirmed = false;
};

struct ExecutionReport {
    std::string output;
    int exit_code = 1;
    double elapsed_seconds = 0.0;
    ResultCode code = ResultCode::OK;

    bool ok() const noexcept { return code == ResultCode::OK && exit_code == 0; }
};

/**
 * Turns an execution request into a report.
 *
 *   enabled -> lookup -> environment gate -> confirmation
 *           -> collect options -> validate -> execute -> audit
 *
 * Every refusal is a report with a non-zero exit code; nothing throws out of
 * dispatch(). Validation failure makes execution unreachable.
 */
class CommandDispatcher {
public:
    CommandDispatcher(const CommandRegistry& registry, config::RunnerConfig config,
                      std::shared_ptr<audit::AuditSink> audit = nullptr);

    ExecutionReport dispatch(const ExecutionRequest& request) const;

    // eligible commands for the current environment, in registration order
    std::vector<CommandHandle> eligibleCommands() const;

    /**
     * {
     *   "environment": "...",
     *   "categories": { "<category>": [ { "key": "...", <Command::toConfig()> } ] },
     *   "disabled": [ "<name>" ]     // shown but not runnable
     * }
     * Hidden commands appear nowhere.
     */
    nlohmann::ordered_json catalog() const;

    const config::RunnerConfig& config() const noexcept { return config_; }

private:
    ExecutionReport refuse(const ExecutionRequest& request, ResultCode code, const std::string& message) const;
    void record(const ExecutionRequest& request, const OptionValues& values,
                const ExecutionReport& report, const ExecutionContext& context) const;

    const CommandRegistry& registry_;
    const config::RunnerConfig config_;
    const policy::EnvironmentPolicy policy_;
    std::shared_ptr<audit::AuditSink> audit_;

    inline static constexpr const char* LOG_TAG = "CommandDispatcher";
};

} // namespace command
