#include "command_dispatcher.hpp"

#include <chrono>
#include <exception>

#include <fmt/core.h>

#include "command_helper.hpp"
#include "common/result_helper.hpp"
#include "logging/logging.hpp"
#include "messaging/message_codec.hpp"
#include "output/output_formatter.hpp"

namespace command {

CommandDispatcher::CommandDispatcher(const CommandRegistry& registry, config::RunnerConfig config,
                                     std::shared_ptr<audit::AuditSink> audit)
    : registry_(registry),
      config_(std::move(config)),
      policy_(config_.environmentPolicy()),
      audit_(std::move(audit)) {}

ExecutionReport CommandDispatcher::refuse(const ExecutionRequest& request, ResultCode code,
                                          const std::string& message) const {
    LOGW("refused '{}' for {}: {} ({})", request.command,
         request.user.empty() ? "CLI" : request.user, message, to_string(code));

    ExecutionReport report;
    report.code = code;
    report.exit_code = 1;
    report.output = "❌ " + message + "\n";
    return report;
}

ExecutionReport CommandDispatcher::dispatch(const ExecutionRequest& request) const {
    if (!config_.enabled)
        return refuse(request, ResultCode::Disabled, "Command runner is disabled");

    auto cmd = registry_.get(request.command);
    if (!cmd)
        return refuse(request, ResultCode::NotFound, fmt::format("Command '{}' not found", request.command));

    const auto& descriptor = cmd->descriptor();
    if (!policy_.isEligible(descriptor, config_.environment)) {
        return refuse(request, ResultCode::PermissionDenied,
                      fmt::format("Command '{}' ({} risk) is not allowed in the {} environment",
                                  request.command, to_string(descriptor.risk), config_.environment));
    }

    if (policy_.confirmationRequired(descriptor, config_.environment) && !request.confirmed) {
        return refuse(request, ResultCode::ConfirmationRequired,
                      fmt::format("Command '{}' requires confirmation", request.command));
    }

    ExecutionContext context;
    context.user = request.user;
    context.environment = config_.environment;
    context.started_at = std::chrono::system_clock::now();

    auto values = CommandHelper::collect(request.options, descriptor.options);

    // fail closed: nothing below runs unless validation passed
    Result<void, ValidationError> valid;
    try {
        valid = cmd->validateOptions(values);
    } catch (const std::exception& e) {
        valid = Result<void, ValidationError>::Error(ResultCode::InternalError,
            ValidationError{ResultCode::InternalError, {}, std::nullopt, e.what()});
    }
    if (!valid) {
        const auto& err = valid.error();
        LOGW("validation failed for '{}': {} ({})", request.command, err.message, to_string(err.code));

        ExecutionReport report;
        report.code = err.code;
        report.exit_code = 1;
        report.output = "❌ Validation failed: " + err.message + "\n";
        record(request, values, report, context);
        return report;
    }

    const auto start = std::chrono::steady_clock::now();
    ExecutionReport report;
    try {
        auto out = cmd->execute(values, context);
        report.output = std::move(out.output);
        report.exit_code = out.exit_code;
    } catch (const std::exception& e) {
        LOGE("'{}' threw: {}", request.command, e.what());
        report.exit_code = 1;
        report.output = output::OutputFormatter::formatExecutionFooter(0.0, 1, std::string(e.what()));
    }
    report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    report.code = report.exit_code == 0 ? ResultCode::OK : ResultCode::ExecutionError;

    if (report.elapsed_seconds > config_.max_execution_time) {
        LOGW("'{}' ran {:.1f}s, over the {}s limit", request.command,
             report.elapsed_seconds, config_.max_execution_time);
    }
    LOGI("'{}' finished: exit={} elapsed={:.3f}s", request.command, report.exit_code, report.elapsed_seconds);

    record(request, values, report, context);
    return report;
}

void CommandDispatcher::record(const ExecutionRequest& request, const OptionValues& values,
                               const ExecutionReport& report, const ExecutionContext& context) const {
    if (!config_.log_executions || !audit_) return;

    audit::AuditRecord rec;
    rec.command = request.command;
    rec.user = request.user;
    rec.exit_code = report.exit_code;
    rec.output = report.output;
    rec.elapsed_seconds = report.elapsed_seconds;
    rec.environment = config_.environment;
    rec.started_at = context.started_at;
    rec.completed_at = std::chrono::system_clock::now();
    try {
        rec.options = message::toJson(values);
    } catch (const std::runtime_error& e) {
        LOGW("audit options of '{}' not serialisable: {}", request.command, e.what());
    }

    auto r = audit_->emit(rec);
    LOG_IF_ERR(r);
}

std::vector<CommandHandle> CommandDispatcher::eligibleCommands() const {
    std::vector<CommandHandle> out;
    for (const auto& cmd : registry_.all()) {
        if (policy_.isEligible(cmd->descriptor(), config_.environment)) out.push_back(cmd);
    }
    return out;
}

nlohmann::ordered_json CommandDispatcher::catalog() const {
    nlohmann::ordered_json j;
    j["environment"] = config_.environment;

    auto categories = nlohmann::ordered_json::object();
    auto disabled = nlohmann::ordered_json::array();

    for (const auto& [category, commands] : registry_.groupByCategory()) {
        for (const auto& cmd : commands) {
            switch (policy_.visibility(cmd->descriptor(), config_.environment)) {
                case policy::Visibility::Enabled: {
                    nlohmann::ordered_json entry;
                    entry["key"] = cmd->name();
                    entry.update(cmd->toConfig());
                    categories[category].push_back(std::move(entry));
                    break;
                }
                case policy::Visibility::Disabled:
                    disabled.push_back(cmd->name());
                    break;
                case policy::Visibility::Hidden:
                    break;
            }
        }
    }

    j["categories"] = categories;
    j["disabled"] = disabled;
    return j;
}

} // namespace command
