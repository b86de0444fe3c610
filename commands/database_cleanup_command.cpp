#include "database_cleanup_command.hpp"

#include <chrono>
#include <cmath>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "command/command_helper.hpp"
#include "logging/logging.hpp"
#include "output/output_formatter.hpp"

namespace commands {

using command::CommandHelper;
using output::OutputFormatter;

namespace {
constexpr const char* kTimestampColumn = "created_at";
}

command::CommandDescriptor DatabaseCleanupCommand::describe() {
    command::CommandDescriptor d;
    d.name = kName;
    d.display_name = "Database Cleanup";
    d.description = "Remove stale records from the database";
    d.category = "Database Maintenance";
    d.risk = command::RiskLevel::Medium;
    d.explicit_confirmation = true;

    command::OptionSpec tables;
    tables.kind = command::OptionKind::Choice;
    tables.label = "Tables to Clean";
    tables.required = true;
    tables.choices = {{"sessions", "Sessions"}, {"failed_jobs", "Failed Jobs"}, {"cache", "Cache"}};
    tables.help = "Select which tables to clean up";

    command::OptionSpec days;
    days.kind = command::OptionKind::Text;
    days.label = "Keep Records Newer Than (Days)";
    days.default_value = std::string("30");
    days.numeric = true;
    days.rules = {command::Rule::integer(), command::Rule::min(1), command::Rule::max(365)};
    days.help = "Records older than this will be deleted";

    command::OptionSpec dry_run;
    dry_run.kind = command::OptionKind::Boolean;
    dry_run.label = "Dry Run (Preview Only)";
    dry_run.default_value = true;
    dry_run.help = "Show what would be deleted without making changes";

    d.options.add("tables", std::move(tables));
    d.options.add("days", std::move(days));
    d.options.add("dry_run", std::move(dry_run));
    return d;
}

DatabaseCleanupCommand::DatabaseCleanupCommand(std::shared_ptr<query::EntityStore> store)
    : Command(describe()), store_(std::move(store)) {}

command::CommandOutput DatabaseCleanupCommand::execute(const command::OptionValues& values,
                                                       const command::ExecutionContext& context) {
    const auto start = std::chrono::steady_clock::now();
    const auto table = CommandHelper::asText(values.at("tables"));
    const auto days = static_cast<long long>(CommandHelper::asNumber(values.at("days")).value_or(30.0));
    const bool dry_run = CommandHelper::asBool(values.at("dry_run"));

    command::CommandOutput result;
    result.output = OutputFormatter::formatExecutionHeader(
        kName, {{"tables", table}, {"days", std::to_string(days)}, {"dry_run", dry_run ? "Yes" : "No"}},
        context.user, context.environment, context.started_at);

    auto& out = result.output;
    out += fmt::format("📊 Database Cleanup: {}\n", table);
    if (dry_run) out += "🔍 DRY RUN - No records will be deleted\n\n";

    // records created before the cutoff are stale
    const auto cutoff_tp = context.started_at - std::chrono::hours(24 * days);
    const auto cutoff = fmt::format("{:%Y-%m-%d %H:%M:%S}",
                                    fmt::gmtime(std::chrono::system_clock::to_time_t(cutoff_tp)));
    out += fmt::format("Scanning {} for records older than {} days...\n", table, days);

    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    // only the offered tables may be purged, whatever reached execute()
    bool offered = false;
    if (const auto* spec = descriptor().options.find("tables")) {
        for (const auto& choice : spec->resolvedChoices()) offered = offered || choice.first == table;
    }
    if (!offered) {
        result.exit_code = 1;
        LOGW("refusing cleanup of '{}': not a cleanable table", table);
        out += OutputFormatter::formatExecutionFooter(elapsed(), 1,
                                                      fmt::format("'{}' is not a cleanable table", table));
        return result;
    }

    if (!store_) {
        result.exit_code = 1;
        out += OutputFormatter::formatExecutionFooter(elapsed(), 1, std::string("no entity store"));
        return result;
    }

    auto purged = store_->purge(table, [&cutoff](const query::Json& r) {
        auto it = r.find(kTimestampColumn);
        return it != r.end() && it->is_string() && it->get<std::string>() < cutoff;
    }, dry_run);

    result.elapsed_seconds = elapsed();
    if (!purged) {
        result.exit_code = 1;
        LOGW("cleanup of {} failed: {}", table, purged.error().value_or("unknown"));
        out += OutputFormatter::formatExecutionFooter(result.elapsed_seconds, 1,
                                                      purged.error().value_or("cleanup failed"));
        return result;
    }

    const auto found = purged.value();
    out += fmt::format("Found {} records matching criteria\n", found);
    if (dry_run) {
        out += fmt::format("Would delete: {} records\n", found);
    } else {
        out += fmt::format("Deleted: {} records\n", found);
        LOGI("{} stale records removed from {}", found, table);
    }

    result.exit_code = 0;
    out += OutputFormatter::formatExecutionFooter(result.elapsed_seconds, 0);
    return result;
}

} // namespace commands
