#include <gtest/gtest.h>

#include "output/output_formatter.hpp"

using output::OutputFormatter;
using Json = nlohmann::ordered_json;

TEST(OutputFormatterTest, FormatResultScalars) {
    EXPECT_EQ(OutputFormatter::formatResult(nullptr), "NULL");
    EXPECT_EQ(OutputFormatter::formatResult(true), "true");
    EXPECT_EQ(OutputFormatter::formatResult(false), "false");
    EXPECT_EQ(OutputFormatter::formatResult(42), "42");
    EXPECT_EQ(OutputFormatter::formatResult(2.5), "2.5");
    EXPECT_EQ(OutputFormatter::formatResult("plain text"), "plain text");
}

TEST(OutputFormatterTest, FormatResultContainersArePrettyJson) {
    EXPECT_EQ(OutputFormatter::formatResult(Json::array({1, 2})), "[\n    1,\n    2\n]");

    Json record = {{"name", "José"}, {"path", "a/b"}};
    auto text = OutputFormatter::formatResult(record);
    EXPECT_NE(text.find("\"name\": \"José\""), std::string::npos);
    EXPECT_NE(text.find("\"path\": \"a/b\""), std::string::npos);
    EXPECT_LT(text.find("name"), text.find("path"));
}

TEST(OutputFormatterTest, FormatSeconds) {
    EXPECT_EQ(OutputFormatter::formatSeconds(0.1234), "0.123");
    EXPECT_EQ(OutputFormatter::formatSeconds(2.5), "2.5");
    EXPECT_EQ(OutputFormatter::formatSeconds(3.0), "3");
    EXPECT_EQ(OutputFormatter::formatSeconds(0.0), "0");
}

TEST(OutputFormatterTest, FormatTimestampIsUtc) {
    EXPECT_EQ(OutputFormatter::formatTimestamp(output::Clock::time_point{}), "1970-01-01 00:00:00 UTC");
    EXPECT_EQ(OutputFormatter::formatTimestamp(output::Clock::from_time_t(1711929600)),
              "2024-04-01 00:00:00 UTC");
}

TEST(OutputFormatterTest, ExecutionHeader) {
    auto header = OutputFormatter::formatExecutionHeader(
        "entity:query", {{"entity", "User"}, {"query", "get()"}}, "", "staging",
        output::Clock::from_time_t(1711929600));

    EXPECT_NE(header.find("COMMAND EXECUTION"), std::string::npos);
    EXPECT_NE(header.find("Command: entity:query\n"), std::string::npos);
    EXPECT_NE(header.find("User: CLI\n"), std::string::npos);
    EXPECT_NE(header.find("Started: 2024-04-01 00:00:00 UTC\n"), std::string::npos);
    EXPECT_NE(header.find("Environment: staging\n"), std::string::npos);
    EXPECT_NE(header.find("Options:\n  - entity: User\n  - query: get()\n"), std::string::npos);
    EXPECT_NE(header.find(OutputFormatter::line("═") + "\n\n"), std::string::npos);

    auto no_options = OutputFormatter::formatExecutionHeader("x", {}, "alice", "production",
                                                             output::Clock::now());
    EXPECT_EQ(no_options.find("Options:"), std::string::npos);
    EXPECT_NE(no_options.find("User: alice\n"), std::string::npos);
}

TEST(OutputFormatterTest, ExecutionFooter) {
    auto ok = OutputFormatter::formatExecutionFooter(1.25, 0, std::nullopt,
                                                     output::Clock::from_time_t(1711929600));
    EXPECT_NE(ok.find("Completed: 2024-04-01 00:00:00 UTC\n"), std::string::npos);
    EXPECT_NE(ok.find("Duration: 1.25s\n"), std::string::npos);
    EXPECT_NE(ok.find("Exit Code: 0\n"), std::string::npos);
    EXPECT_NE(ok.find("Status: ✅ SUCCESS\n"), std::string::npos);

    auto failed = OutputFormatter::formatExecutionFooter(0.5, 1);
    EXPECT_NE(failed.find("Status: ❌ FAILED\n"), std::string::npos);

    auto error = OutputFormatter::formatExecutionFooter(0.5, 1, std::string("boom"));
    EXPECT_NE(error.find("❌ EXECUTION ERROR\nError: boom\n"), std::string::npos);
    EXPECT_EQ(error.find("Exit Code"), std::string::npos);
}

TEST(OutputFormatterTest, StripFormatting) {
    EXPECT_EQ(OutputFormatter::stripFormatting("\x1b[0;32m✅ Done\x1b[0m  "), "Done");
    EXPECT_EQ(OutputFormatter::stripFormatting("ℹ️ note"), "note");
    EXPECT_EQ(OutputFormatter::stripFormatting("❌ a ⚠ b"), "a  b");
    EXPECT_EQ(OutputFormatter::stripFormatting("plain"), "plain");
}

TEST(OutputFormatterTest, SectionHeader) {
    auto header = OutputFormatter::createSectionHeader("TITLE");
    auto expected = "╭" + OutputFormatter::line("─", 58) + "╮\n" +
                    "│" + std::string(27, ' ') + "TITLE" + std::string(28, ' ') + "│\n" +
                    "╰" + OutputFormatter::line("─", 58) + "╯\n";
    EXPECT_EQ(header, expected);
}

TEST(OutputFormatterTest, Table) {
    auto table = OutputFormatter::createTable({"id", "name"}, {{"1", "Alice"}, {"22", "Bo"}});
    const std::string expected =
        "┌────┬───────┐\n"
        "│ id │ name  │\n"
        "├────┼───────┤\n"
        "│ 1  │ Alice │\n"
        "│ 22 │ Bo    │\n"
        "└────┴───────┘";
    EXPECT_EQ(table, expected);
}
