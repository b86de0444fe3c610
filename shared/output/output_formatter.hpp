#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace output {

using Clock = std::chrono::system_clock;

// ordered option key -> display text
using OptionLines = std::vector<std::pair<std::string, std::string>>;

class OutputFormatter {
public:
    static constexpr size_t kRuleWidth = 60;

    // NULL, true/false, numbers as text, strings verbatim, containers as pretty JSON
    static std::string formatResult(const nlohmann::ordered_json& value);

    static std::string formatExecutionHeader(const std::string& command,
                                             const OptionLines& options,
                                             const std::string& user,
                                             const std::string& environment,
                                             Clock::time_point started_at);

    // error set: error block instead of the completion summary
    static std::string formatExecutionFooter(double elapsed_seconds, int exit_code,
                                             const std::optional<std::string>& error = std::nullopt,
                                             Clock::time_point completed_at = Clock::now());

    // ANSI escapes and status glyphs removed, whitespace trimmed
    static std::string stripFormatting(const std::string& text);

    static std::string createSectionHeader(const std::string& title);

    static std::string createTable(const std::vector<std::string>& headers,
                                   const std::vector<std::vector<std::string>>& rows);

    static std::string formatTimestamp(Clock::time_point tp);
    static std::string formatSeconds(double seconds);

    // glyph repeated count times, e.g. line("═")
    static std::string line(const char* glyph, size_t count = kRuleWidth);
};

} // namespace output
