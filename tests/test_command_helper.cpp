#include <gtest/gtest.h>

#include "command/command_helper.hpp"

using namespace command;

namespace {

OptionSpec text(const std::string& label, bool required, std::vector<Rule> rules = {}) {
    OptionSpec s;
    s.kind = OptionKind::Text;
    s.label = label;
    s.required = required;
    s.rules = std::move(rules);
    return s;
}

} // namespace

TEST(CommandHelperTest, RequiredOptionMustBePresent) {
    OptionSchema schema{{"name", text("Name", true)}};

    auto r = CommandHelper::validate({}, schema);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.code(), ResultCode::MissingRequired);
    EXPECT_EQ(r.error().key, "name");
    EXPECT_EQ(r.error().message, "Option 'Name' is required");

    EXPECT_TRUE(CommandHelper::validate({{"name", std::string("x")}}, schema));
}

TEST(CommandHelperTest, EmptyStringAndFalseCountAsMissing) {
    OptionSchema schema{{"flag", text("", true)}};

    auto r = CommandHelper::validate({{"flag", std::string("")}}, schema);
    EXPECT_EQ(r.code(), ResultCode::MissingRequired);
    EXPECT_EQ(r.error().message, "Option 'flag' is required");

    r = CommandHelper::validate({{"flag", false}}, schema);
    EXPECT_EQ(r.code(), ResultCode::MissingRequired);

    EXPECT_TRUE(CommandHelper::validate({{"flag", true}}, schema));
    EXPECT_TRUE(CommandHelper::validate({{"flag", 0}}, schema));
}

TEST(CommandHelperTest, MaxRuleRejectsLargeValue) {
    OptionSchema schema{{"limit", text("Limit", false, {Rule::integer(), Rule::min(1), Rule::max(10000)})}};

    auto r = CommandHelper::validate({{"limit", std::string("50000")}}, schema);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.code(), ResultCode::RuleViolation);
    EXPECT_EQ(r.error().key, "limit");
    ASSERT_TRUE(r.error().rule.has_value());
    EXPECT_EQ(*r.error().rule, RuleName::Max);
    EXPECT_EQ(r.error().message, "Option 'limit' must not exceed 10000");

    r = CommandHelper::validate({{"limit", std::string("0")}}, schema);
    EXPECT_EQ(r.error().rule, RuleName::Min);
    EXPECT_EQ(r.error().message, "Option 'limit' must be at least 1");

    EXPECT_TRUE(CommandHelper::validate({{"limit", std::string("10000")}}, schema));
    EXPECT_TRUE(CommandHelper::validate({{"limit", 25}}, schema));
}

TEST(CommandHelperTest, IntegerAndNumericRules) {
    OptionSchema ints{{"n", text("N", false, {Rule::integer()})}};
    EXPECT_TRUE(CommandHelper::validate({{"n", std::string("12")}}, ints));
    EXPECT_TRUE(CommandHelper::validate({{"n", std::string("-3")}}, ints));

    auto r = CommandHelper::validate({{"n", std::string("12.5")}}, ints);
    EXPECT_EQ(r.code(), ResultCode::RuleViolation);
    EXPECT_EQ(r.error().message, "Option 'n' must be an integer");

    OptionSchema nums{{"x", text("X", false, {Rule::numeric()})}};
    EXPECT_TRUE(CommandHelper::validate({{"x", std::string("1e3")}}, nums));
    EXPECT_TRUE(CommandHelper::validate({{"x", 2.5}}, nums));
    r = CommandHelper::validate({{"x", std::string("0x10")}}, nums);
    EXPECT_EQ(r.error().message, "Option 'x' must be numeric");
}

TEST(CommandHelperTest, FirstFailingRuleWins) {
    OptionSchema schema{{"n", text("N", false, {Rule::integer(), Rule::max(10)})}};
    auto r = CommandHelper::validate({{"n", std::string("abc")}}, schema);
    EXPECT_EQ(r.error().rule, RuleName::Integer);
}

TEST(CommandHelperTest, BoundsIgnoreNonNumericValues) {
    OptionSchema schema{{"n", text("N", false, {Rule::min(1)})}};
    EXPECT_TRUE(CommandHelper::validate({{"n", std::string("abc")}}, schema));
}

TEST(CommandHelperTest, AbsentOptionalValuesSkipRules) {
    OptionSchema schema{{"n", text("N", false, {Rule::integer()})}};
    EXPECT_TRUE(CommandHelper::validate({}, schema));
    EXPECT_TRUE(CommandHelper::validate({{"n", std::string("")}}, schema));
}

TEST(CommandHelperTest, KeysAreCheckedInSchemaOrder) {
    OptionSchema schema{
        {"first", text("First", true)},
        {"second", text("Second", true)},
    };
    auto r = CommandHelper::validate({{"second", std::string("x")}}, schema);
    EXPECT_EQ(r.error().key, "first");
}

TEST(CommandHelperTest, ChoiceValueMustBeOffered) {
    OptionSpec table;
    table.kind = OptionKind::Choice;
    table.label = "Table";
    table.choices = {{"sessions", "Sessions"}, {"cache", "Cache"}};
    OptionSchema schema{{"table", table}};

    EXPECT_TRUE(CommandHelper::validate({{"table", std::string("cache")}}, schema));
    EXPECT_TRUE(CommandHelper::validate({}, schema));

    auto r = CommandHelper::validate({{"table", std::string("users")}}, schema);
    EXPECT_EQ(r.code(), ResultCode::InvalidChoice);
    EXPECT_EQ(r.error().key, "table");
    EXPECT_FALSE(r.error().rule.has_value());
    EXPECT_EQ(r.error().message, "Option 'Table' must be one of: sessions, cache");

    // labels are not accepted in place of keys
    EXPECT_EQ(CommandHelper::validate({{"table", std::string("Sessions")}}, schema).code(),
              ResultCode::InvalidChoice);
}

TEST(CommandHelperTest, ResolvedChoicesAreReadAtValidation) {
    ChoiceList live{{"a", "A"}};
    OptionSpec pick;
    pick.kind = OptionKind::Choice;
    pick.choice_resolver = [&live]() { return live; };
    OptionSchema schema{{"pick", pick}};

    EXPECT_FALSE(CommandHelper::validate({{"pick", std::string("b")}}, schema));
    live.emplace_back("b", "B");
    EXPECT_TRUE(CommandHelper::validate({{"pick", std::string("b")}}, schema));
}

TEST(CommandHelperTest, CollectAppliesDefaultsAndDropsUnknownKeys) {
    OptionSpec days = text("Days", false);
    days.default_value = std::string("30");
    OptionSchema schema{{"days", days}, {"table", text("Table", false)}};

    auto values = CommandHelper::collect({{"table", std::string("cache")}, {"extra", 1}}, schema);
    EXPECT_EQ(values.size(), 2u);
    EXPECT_EQ(CommandHelper::get<std::string>(values, "days"), "30");
    EXPECT_EQ(CommandHelper::get<std::string>(values, "table"), "cache");
    EXPECT_EQ(values.count("extra"), 0u);
}

TEST(CommandHelperTest, Conversions) {
    EXPECT_EQ(CommandHelper::asNumber(std::any(std::string(" 42 "))), 42.0);
    EXPECT_EQ(CommandHelper::asNumber(std::any(7)), 7.0);
    EXPECT_FALSE(CommandHelper::asNumber(std::any(std::string("seven"))).has_value());

    EXPECT_EQ(CommandHelper::asText(std::any(true)), "true");
    EXPECT_EQ(CommandHelper::asText(std::any(12LL)), "12");

    EXPECT_TRUE(CommandHelper::asBool(std::any(std::string("yes"))));
    EXPECT_TRUE(CommandHelper::asBool(std::any(1)));
    EXPECT_FALSE(CommandHelper::asBool(std::any(std::string("off"))));

    OptionValues values{{"n", 5}};
    EXPECT_EQ(CommandHelper::getOr<int>(values, "n", 0), 5);
    EXPECT_EQ(CommandHelper::getOr<int>(values, "missing", 9), 9);
    EXPECT_EQ(CommandHelper::getOr<std::string>(values, "n", "fallback"), "fallback");
}
