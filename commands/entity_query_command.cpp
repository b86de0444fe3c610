#include "entity_query_command.hpp"

#include <fmt/core.h>

#include "command/command_helper.hpp"
#include "logging/logging.hpp"
#include "output/output_formatter.hpp"
#include "query/query_executor.hpp"
#include "query/query_validator.hpp"

namespace commands {

using command::CommandHelper;
using output::OutputFormatter;

command::CommandDescriptor EntityQueryCommand::describe(std::shared_ptr<const query::EntitySource> source) {
    command::CommandDescriptor d;
    d.name = kName;
    d.display_name = "Entity Query Runner";
    d.description = "Run safe queries for data exploration and analysis. Only read-only operations are allowed.";
    d.category = "Data Exploration";
    d.risk = command::RiskLevel::Low;
    d.explicit_confirmation = false;

    command::OptionSpec entity;
    entity.kind = command::OptionKind::Choice;
    entity.label = "Entity";
    entity.required = true;
    entity.choice_resolver = [source]() { return source ? source->types() : command::ChoiceList{}; };
    entity.help = "Select the entity type to query";

    command::OptionSpec expr;
    expr.kind = command::OptionKind::LongText;
    expr.label = "Query";
    expr.required = true;
    expr.placeholder = "whereDate('created_at', '2024-01-01')->get()->pluck('name', 'id')";
    expr.help = "Method chain to run against the entity, e.g. where('age', '>', 18)->orderBy('name')->get()";

    d.options.add("entity", std::move(entity));
    d.options.add("query", std::move(expr));
    return d;
}

EntityQueryCommand::EntityQueryCommand(std::shared_ptr<const query::EntitySource> source)
    : Command(describe(source)), source_(std::move(source)) {}

Result<void, command::ValidationError> EntityQueryCommand::validateOptions(const command::OptionValues& values) const {
    using Failure = Result<void, command::ValidationError>;

    auto base = Command::validateOptions(values);
    const bool unknown_entity = !base && base.code() == ResultCode::InvalidChoice && base.error().key == "entity";
    if (!base && !unknown_entity) return base;

    const auto entity = CommandHelper::asText(values.at("entity"));
    if (unknown_entity || !source_ || !source_->contains(entity)) {
        return Failure::Error(ResultCode::UnknownEntityType,
                              {ResultCode::UnknownEntityType, "entity", std::nullopt,
                               fmt::format("Entity type '{}' does not exist.", entity)});
    }

    auto checked = query::QueryValidator::check(CommandHelper::asText(values.at("query")));
    if (!checked) {
        return Failure::Error(checked.code, {checked.code, "query", std::nullopt, checked.message});
    }
    return Failure::OK();
}

command::CommandOutput EntityQueryCommand::execute(const command::OptionValues& values,
                                                   const command::ExecutionContext& context) {
    const auto entity = CommandHelper::asText(values.at("entity"));
    const auto expr = CommandHelper::asText(values.at("query"));

    std::string out = OutputFormatter::formatExecutionHeader(
        kName, {{"entity", entity}, {"query", expr}},
        context.user, context.environment, context.started_at);

    out += fmt::format("📋 Entity: {}\n", entity);
    out += fmt::format("📋 Query: {}\n\n", expr);
    out += fmt::format("Executing: {}::{}\n", entity, expr);
    out += OutputFormatter::line("─") + "\n\n";

    command::CommandOutput result;
    if (!source_) {
        out += OutputFormatter::formatExecutionFooter(0.0, 1, std::string("no entity source"));
        result.output = std::move(out);
        result.exit_code = 1;
        return result;
    }

    query::QueryExecutor executor(*source_);
    auto outcome = executor.run(entity, expr);
    result.elapsed_seconds = outcome.elapsed_seconds;
    result.exit_code = outcome.exitCode();

    if (!outcome.ok) {
        LOGW("query on {} failed: {}", entity, outcome.error_message);
        out += OutputFormatter::formatExecutionFooter(outcome.elapsed_seconds, 1, outcome.error_message);
        result.output = std::move(out);
        return result;
    }

    out += "✅ Query executed successfully\n\n";
    out += "Results:\n";
    out += OutputFormatter::line("─") + "\n";
    out += OutputFormatter::formatResult(outcome.value) + "\n";
    out += OutputFormatter::formatExecutionFooter(outcome.elapsed_seconds, 0);

    result.output = std::move(out);
    return result;
}

} // namespace commands
