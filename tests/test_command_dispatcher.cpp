#include <gtest/gtest.h>

#include "audit/audit_sink.hpp"
#include "command/command_dispatcher.hpp"
#include "command/command_helper.hpp"
#include "test_support.hpp"

using namespace command;
using testing_support::StubCommand;
using testing_support::descriptor;

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ping = std::make_shared<StubCommand>(descriptor("ping", RiskLevel::Low, "Utility"));
        cleanup = std::make_shared<StubCommand>(descriptor("cleanup", RiskLevel::Medium, "Maintenance"));
        nuke = std::make_shared<StubCommand>(descriptor("nuke", RiskLevel::High, "Maintenance"));

        auto d = descriptor("report", RiskLevel::Low, "Reports");
        OptionSpec limit;
        limit.label = "Limit";
        limit.default_value = std::string("5");
        limit.rules = {Rule::integer(), Rule::max(10)};
        d.options.add("limit", limit);
        report = std::make_shared<StubCommand>(d);

        registry.registerCommands({ping, cleanup, nuke, report});

        cfg.environment = "staging";
        cfg.environment_restrictions["staging"] = {{RiskLevel::Low, RiskLevel::Medium}, false};
        cfg.environment_restrictions["production"] = {{RiskLevel::Low}, true};
    }

    CommandDispatcher dispatcher() const { return CommandDispatcher(registry, cfg, audit); }

    static ExecutionRequest request(const std::string& name, OptionValues options = {},
                                    bool confirmed = false) {
        ExecutionRequest r;
        r.command = name;
        r.options = std::move(options);
        r.user = "alice";
        r.confirmed = confirmed;
        return r;
    }

    CommandRegistry registry;
    config::RunnerConfig cfg;
    std::shared_ptr<audit::MemoryAuditSink> audit = std::make_shared<audit::MemoryAuditSink>();
    std::shared_ptr<StubCommand> ping, cleanup, nuke, report;
};

TEST_F(CommandDispatcherTest, ExecutesEligibleCommand) {
    auto report_out = dispatcher().dispatch(request("ping"));
    EXPECT_TRUE(report_out.ok());
    EXPECT_EQ(report_out.exit_code, 0);
    EXPECT_EQ(report_out.code, ResultCode::OK);
    EXPECT_EQ(report_out.output, "ran ping");
    EXPECT_EQ(ping->executions.load(), 1);
    EXPECT_EQ(ping->last_context.user, "alice");
    EXPECT_EQ(ping->last_context.environment, "staging");

    auto records = audit->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].command, "ping");
    EXPECT_EQ(records[0].user, "alice");
    EXPECT_EQ(records[0].environment, "staging");
    EXPECT_EQ(records[0].exit_code, 0);
    EXPECT_EQ(records[0].output, "ran ping");
}

TEST_F(CommandDispatcherTest, UnknownCommand) {
    auto r = dispatcher().dispatch(request("missing"));
    EXPECT_EQ(r.code, ResultCode::NotFound);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.output, "❌ Command 'missing' not found\n");
    EXPECT_TRUE(audit->records().empty());
}

TEST_F(CommandDispatcherTest, MasterSwitchDisablesEverything) {
    cfg.enabled = false;
    auto r = dispatcher().dispatch(request("ping"));
    EXPECT_EQ(r.code, ResultCode::Disabled);
    EXPECT_EQ(ping->executions.load(), 0);
}

TEST_F(CommandDispatcherTest, RestrictedRiskIsNeverExecuted) {
    auto r = dispatcher().dispatch(request("nuke", {}, true));
    EXPECT_EQ(r.code, ResultCode::PermissionDenied);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(nuke->executions.load(), 0);
    EXPECT_TRUE(audit->records().empty());
}

TEST_F(CommandDispatcherTest, MediumRiskNeedsConfirmation) {
    auto r = dispatcher().dispatch(request("cleanup"));
    EXPECT_EQ(r.code, ResultCode::ConfirmationRequired);
    EXPECT_EQ(r.output, "❌ Command 'cleanup' requires confirmation\n");
    EXPECT_EQ(cleanup->executions.load(), 0);

    r = dispatcher().dispatch(request("cleanup", {}, true));
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(cleanup->executions.load(), 1);
}

TEST_F(CommandDispatcherTest, ProductionConfirmsEvenLowRisk) {
    cfg.environment = "production";
    auto r = dispatcher().dispatch(request("ping"));
    EXPECT_EQ(r.code, ResultCode::ConfirmationRequired);

    r = dispatcher().dispatch(request("ping", {}, true));
    EXPECT_TRUE(r.ok());

    cfg.require_confirmation_for_production = false;
    r = dispatcher().dispatch(request("ping"));
    EXPECT_TRUE(r.ok());
}

TEST_F(CommandDispatcherTest, ValidationFailureBlocksExecution) {
    auto r = dispatcher().dispatch(request("report", {{"limit", std::string("50")}}));
    EXPECT_EQ(r.code, ResultCode::RuleViolation);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.output, "❌ Validation failed: Option 'limit' must not exceed 10\n");
    EXPECT_EQ(report->executions.load(), 0);

    auto records = audit->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].exit_code, 1);
    EXPECT_EQ(records[0].options["limit"], "50");
}

TEST_F(CommandDispatcherTest, DefaultsAreAppliedAndUnknownOptionsDropped) {
    auto r = dispatcher().dispatch(request("report", {{"bogus", 1}}));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(CommandHelper::get<std::string>(report->last_values, "limit"), "5");
    EXPECT_EQ(report->last_values.count("bogus"), 0u);
}

TEST_F(CommandDispatcherTest, ThrowingCommandReportsError) {
    ping->throw_on_execute = true;
    auto r = dispatcher().dispatch(request("ping"));
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.code, ResultCode::ExecutionError);
    EXPECT_NE(r.output.find("❌ EXECUTION ERROR"), std::string::npos);
    EXPECT_NE(r.output.find("stub failure"), std::string::npos);
    ASSERT_EQ(audit->records().size(), 1u);
}

TEST_F(CommandDispatcherTest, ThrowingValidatorFailsClosed) {
    ping->throw_on_validate = true;
    auto r = dispatcher().dispatch(request("ping"));
    EXPECT_EQ(r.code, ResultCode::InternalError);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.output, "❌ Validation failed: stub validation failure\n");
    EXPECT_EQ(ping->executions.load(), 0);
    ASSERT_EQ(audit->records().size(), 1u);
}

TEST_F(CommandDispatcherTest, NonZeroExitIsExecutionError) {
    auto failing = std::make_shared<StubCommand>(descriptor("fail"), 3);
    ASSERT_TRUE(registry.registerCommand(failing));
    auto r = dispatcher().dispatch(request("fail"));
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.code, ResultCode::ExecutionError);
    EXPECT_FALSE(r.ok());
}

TEST_F(CommandDispatcherTest, AuditCanBeTurnedOff) {
    cfg.log_executions = false;
    auto r = dispatcher().dispatch(request("ping"));
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(audit->records().empty());

    CommandDispatcher without_sink(registry, cfg);
    EXPECT_TRUE(without_sink.dispatch(request("ping")).ok());
}

TEST_F(CommandDispatcherTest, EligibleCommandsFollowEnvironment) {
    auto eligible = dispatcher().eligibleCommands();
    ASSERT_EQ(eligible.size(), 3u);
    EXPECT_EQ(eligible[0]->name(), "ping");
    EXPECT_EQ(eligible[1]->name(), "cleanup");
    EXPECT_EQ(eligible[2]->name(), "report");

    cfg.environment = "development";
    EXPECT_EQ(dispatcher().eligibleCommands().size(), 4u);
}

TEST_F(CommandDispatcherTest, CatalogListsDisabledSeparately) {
    auto catalog = dispatcher().catalog();
    EXPECT_EQ(catalog["environment"], "staging");

    const auto& categories = catalog["categories"];
    ASSERT_TRUE(categories.contains("Maintenance"));
    ASSERT_EQ(categories["Maintenance"].size(), 1u);
    EXPECT_EQ(categories["Maintenance"][0]["key"], "cleanup");
    EXPECT_EQ(categories["Maintenance"][0]["danger_level"], "medium");
    EXPECT_TRUE(categories.contains("Utility"));
    EXPECT_TRUE(categories.contains("Reports"));

    EXPECT_EQ(catalog["disabled"], nlohmann::ordered_json::array({"nuke"}));
}

TEST_F(CommandDispatcherTest, CatalogHidesRestrictedCommands) {
    cfg.environment = "production";
    auto catalog = dispatcher().catalog();
    const auto& categories = catalog["categories"];

    EXPECT_FALSE(categories.contains("Maintenance"));
    EXPECT_TRUE(categories.contains("Utility"));
    EXPECT_TRUE(catalog["disabled"].empty());
    EXPECT_EQ(catalog.dump().find("nuke"), std::string::npos);
}
