#include <gtest/gtest.h>

#include "command/command_registry.hpp"
#include "test_support.hpp"

using namespace command;
using testing_support::StubCommand;
using testing_support::descriptor;

namespace {

CommandHandle stub(const std::string& name, RiskLevel risk = RiskLevel::Low,
                   const std::string& category = "Utility") {
    return std::make_shared<StubCommand>(descriptor(name, risk, category));
}

} // namespace

TEST(CommandRegistryTest, RegisterAndGet) {
    CommandRegistry registry;
    auto cmd = stub("cache:clear");
    ASSERT_TRUE(registry.registerCommand(cmd));

    EXPECT_TRUE(registry.has("cache:clear"));
    EXPECT_EQ(registry.get("cache:clear"), cmd);
    EXPECT_EQ(registry.get("missing"), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(CommandRegistryTest, ReRegistrationOverwritesInPlace) {
    CommandRegistry registry;
    ASSERT_TRUE(registry.registerCommand(stub("a")));
    ASSERT_TRUE(registry.registerCommand(stub("b")));
    auto replacement = stub("a", RiskLevel::High);
    ASSERT_TRUE(registry.registerCommand(replacement));

    auto all = registry.all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], replacement);
    EXPECT_EQ(all[1]->name(), "b");
}

TEST(CommandRegistryTest, RejectsMalformedDescriptors) {
    CommandRegistry registry;
    auto original = stub("x");
    ASSERT_TRUE(registry.registerCommand(original));

    auto nameless = descriptor("");
    auto r = registry.registerCommand(std::make_shared<StubCommand>(nameless));
    EXPECT_EQ(r.code(), ResultCode::InvalidCommand);

    auto bad_choice = descriptor("x");
    OptionSpec choice;
    choice.kind = OptionKind::Choice;
    bad_choice.options.add("pick", choice);
    r = registry.registerCommand(std::make_shared<StubCommand>(bad_choice));
    EXPECT_EQ(r.code(), ResultCode::InvalidCommand);

    auto unbounded = descriptor("x");
    OptionSpec n;
    n.rules = {Rule{RuleName::Max, std::nullopt}};
    unbounded.options.add("n", n);
    r = registry.registerCommand(std::make_shared<StubCommand>(unbounded));
    EXPECT_EQ(r.code(), ResultCode::InvalidCommand);

    EXPECT_EQ(registry.registerCommand(nullptr).code(), ResultCode::InvalidCommand);

    EXPECT_EQ(registry.get("x"), original);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(CommandRegistryTest, RegisterCommandsSkipsFailures) {
    CommandRegistry registry;
    auto count = registry.registerCommands({stub("a"), stub(""), stub("b")});
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(CommandRegistryTest, Queries) {
    CommandRegistry registry;
    auto low = descriptor("report", RiskLevel::Low, "Reports");
    low.explicit_confirmation = true;
    registry.registerCommands({
        std::make_shared<StubCommand>(low),
        stub("ping", RiskLevel::Low, "Utility"),
        stub("cleanup", RiskLevel::Medium, "Maintenance"),
        stub("purge", RiskLevel::High, "Maintenance"),
    });

    auto grouped = registry.groupByCategory();
    ASSERT_EQ(grouped.size(), 3u);
    EXPECT_EQ(grouped["Maintenance"].size(), 2u);
    EXPECT_EQ(grouped["Maintenance"][0]->name(), "cleanup");

    auto lows = registry.filterByRisk(RiskLevel::Low);
    ASSERT_EQ(lows.size(), 2u);
    EXPECT_EQ(lows[0]->name(), "report");

    auto confirming = registry.requiringConfirmation();
    ASSERT_EQ(confirming.size(), 3u);
    EXPECT_EQ(confirming[0]->name(), "report");
    EXPECT_EQ(confirming[1]->name(), "cleanup");
    EXPECT_EQ(confirming[2]->name(), "purge");
}

TEST(CommandRegistryTest, ToConfigDescribesOptions) {
    auto d = descriptor("db:cleanup", RiskLevel::Medium, "Database Maintenance");
    d.display_name = "Database Cleanup";
    OptionSpec days;
    days.label = "Days";
    days.default_value = std::string("30");
    days.numeric = true;
    days.rules = {Rule::integer(), Rule::min(1), Rule::max(365)};
    d.options.add("days", days);
    OptionSpec table;
    table.kind = OptionKind::Choice;
    table.label = "Table";
    table.required = true;
    table.choices = {{"sessions", "Sessions"}, {"cache", "Cache"}};
    d.options.add("table", table);

    CommandRegistry registry;
    ASSERT_TRUE(registry.registerCommand(std::make_shared<StubCommand>(d)));

    auto j = registry.toConfig();
    ASSERT_TRUE(j.contains("db:cleanup"));
    const auto& c = j["db:cleanup"];
    EXPECT_EQ(c["name"], "Database Cleanup");
    EXPECT_EQ(c["category"], "Database Maintenance");
    EXPECT_EQ(c["danger_level"], "medium");
    EXPECT_EQ(c["requires_confirmation"], true);
    EXPECT_EQ(c["options"]["days"]["type"], "text");
    EXPECT_EQ(c["options"]["days"]["default"], "30");
    EXPECT_EQ(c["options"]["days"]["validation"], "integer|min:1|max:365");
    EXPECT_EQ(c["options"]["table"]["type"], "select");
    EXPECT_EQ(c["options"]["table"]["options"]["cache"], "Cache");
    EXPECT_TRUE(c["options"]["table"]["required"].get<bool>());
}

TEST(CommandRegistryTest, ChoiceResolverIsConsultedOnRender) {
    int calls = 0;
    auto d = descriptor("pick");
    OptionSpec spec;
    spec.kind = OptionKind::Choice;
    spec.choice_resolver = [&calls]() {
        ++calls;
        return ChoiceList{{"k" + std::to_string(calls), "label"}};
    };
    d.options.add("entity", spec);
    StubCommand cmd(d);

    EXPECT_TRUE(cmd.toConfig()["options"]["entity"]["options"].contains("k1"));
    EXPECT_TRUE(cmd.toConfig()["options"]["entity"]["options"].contains("k2"));
}

TEST(CommandRegistryTest, Reset) {
    CommandRegistry registry;
    registry.registerCommands({stub("a"), stub("b")});
    registry.reset();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.all().empty());
}
