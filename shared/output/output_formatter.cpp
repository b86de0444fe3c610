#include "output_formatter.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <regex>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "common/string_helper.hpp"

namespace output {

std::string OutputFormatter::line(const char* glyph, size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) out += glyph;
    return out;
}

std::string OutputFormatter::formatResult(const nlohmann::ordered_json& value) {
    if (value.is_null()) return "NULL";
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    return value.dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string OutputFormatter::formatTimestamp(Clock::time_point tp) {
    return fmt::format("{:%Y-%m-%d %H:%M:%S} UTC", fmt::gmtime(Clock::to_time_t(tp)));
}

std::string OutputFormatter::formatSeconds(double seconds) {
    // three decimals, trailing zeros dropped
    auto s = fmt::format("{:.3f}", std::round(seconds * 1000.0) / 1000.0);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

std::string OutputFormatter::formatExecutionHeader(const std::string& command,
                                                   const OptionLines& options,
                                                   const std::string& user,
                                                   const std::string& environment,
                                                   Clock::time_point started_at) {
    std::string out;
    out += "╭─────────────────────────────────────────────────────╮\n";
    out += "│                  COMMAND EXECUTION                  │\n";
    out += "╰─────────────────────────────────────────────────────╯\n\n";
    out += fmt::format("Command: {}\n", command);
    out += fmt::format("User: {}\n", user.empty() ? "CLI" : user);
    out += fmt::format("Started: {}\n", formatTimestamp(started_at));
    out += fmt::format("Environment: {}\n", environment);

    if (!options.empty()) {
        out += "Options:\n";
        for (const auto& [key, value] : options) out += fmt::format("  - {}: {}\n", key, value);
    }

    out += line("═", kRuleWidth) + "\n\n";
    return out;
}

std::string OutputFormatter::formatExecutionFooter(double elapsed_seconds, int exit_code,
                                                   const std::optional<std::string>& error,
                                                   Clock::time_point completed_at) {
    std::string out = "\n" + line("═", kRuleWidth) + "\n";

    if (error) {
        out += "❌ EXECUTION ERROR\n";
        out += fmt::format("Error: {}\n", *error);
        return out;
    }

    out += fmt::format("Completed: {}\n", formatTimestamp(completed_at));
    out += fmt::format("Duration: {}s\n", formatSeconds(elapsed_seconds));
    out += fmt::format("Exit Code: {}\n", exit_code);
    out += fmt::format("Status: {}\n", exit_code == 0 ? "✅ SUCCESS" : "❌ FAILED");
    return out;
}

std::string OutputFormatter::stripFormatting(const std::string& text) {
    static const std::regex ansi("\x1b\\[[0-9;]*m");
    auto out = std::regex_replace(text, ansi, "");

    // ✅ ❌ ⚠ ℹ and the emoji variation selector
    static const char* glyphs[] = {"✅", "❌", "⚠", "ℹ", "️"};
    for (const char* g : glyphs) {
        const std::string needle(g);
        for (auto pos = out.find(needle); pos != std::string::npos; pos = out.find(needle, pos)) {
            out.erase(pos, needle.size());
        }
    }
    return trim(out);
}

std::string OutputFormatter::createSectionHeader(const std::string& title) {
    const auto width = kRuleWidth;
    const auto padding = title.size() < width ? width - title.size() : 0;
    const auto left = padding / 2;
    const auto right = padding - left;

    return "╭" + line("─", width - 2) + "╮\n" +
           "│" + std::string(left, ' ') + title + std::string(right, ' ') + "│\n" +
           "╰" + line("─", width - 2) + "╯\n";
}

std::string OutputFormatter::createTable(const std::vector<std::string>& headers,
                                         const std::vector<std::vector<std::string>>& rows) {
    std::vector<size_t> widths;
    for (const auto& h : headers) widths.push_back(h.size());
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i >= widths.size()) widths.push_back(0);
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto border = [&widths](const char* left, const char* mid, const char* right) {
        std::string out = left;
        for (size_t i = 0; i < widths.size(); ++i) {
            if (i > 0) out += mid;
            out += line("─", widths[i] + 2);
        }
        return out + right;
    };
    auto cells_line = [&widths](const std::vector<std::string>& cells) {
        std::string out = "│";
        for (size_t i = 0; i < cells.size(); ++i) {
            out += fmt::format(" {:<{}} │", cells[i], widths[i]);
        }
        return out;
    };

    std::string out = border("┌", "┬", "┐") + "\n";
    out += cells_line(headers) + "\n";
    out += border("├", "┼", "┤") + "\n";
    for (const auto& row : rows) out += cells_line(row) + "\n";
    out += border("└", "┴", "┘");
    return out;
}

} // namespace output
