#pragma once
#include <any>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/result.h"
#include "common/message.hpp"

namespace command {

using OptionValues = message::Values;

enum class RiskLevel {
    Low,
    Medium,
    High
};

enum class OptionKind {
    Text,       // single line input
    LongText,   // textarea
    Choice,     // select
    Boolean     // checkbox
};

enum class RuleName {
    Integer,
    Numeric,
    Min,
    Max
};

struct Rule {
    RuleName name;
    std::optional<long long> arg;   // Min / Max bound

    static Rule integer() { return {RuleName::Integer, std::nullopt}; }
    static Rule numeric() { return {RuleName::Numeric, std::nullopt}; }
    static Rule min(long long n) { return {RuleName::Min, n}; }
    static Rule max(long long n) { return {RuleName::Max, n}; }
};

// ordered key -> label
using ChoiceList = std::vector<std::pair<std::string, std::string>>;

// Supplied by the host application; resolved each time the schema is rendered.
using ChoiceResolver = std::function<ChoiceList()>;

struct OptionSpec {
    OptionKind kind = OptionKind::Text;
    std::string label;
    bool required = false;
    std::any default_value;          // empty = no default
    bool numeric = false;
    ChoiceList choices;              // Choice only
    ChoiceResolver choice_resolver;  // Choice only, takes precedence over choices
    std::vector<Rule> rules;
    std::string help;
    std::string placeholder;

    bool hasDefault() const noexcept { return default_value.has_value(); }

    ChoiceList resolvedChoices() const {
        return choice_resolver ? choice_resolver() : choices;
    }
};

// Insertion order drives rendering order.
class OptionSchema {
public:
    using Entry = std::pair<std::string, OptionSpec>;

    OptionSchema() = default;
    OptionSchema(std::initializer_list<Entry> entries) {
        for (const auto& e : entries) add(e.first, e.second);
    }

    // Re-adding a key replaces the spec in place.
    OptionSchema& add(const std::string& key, OptionSpec spec) {
        for (auto& e : entries_) {
            if (e.first == key) {
                e.second = std::move(spec);
                return *this;
            }
        }
        entries_.emplace_back(key, std::move(spec));
        return *this;
    }

    const OptionSpec* find(const std::string& key) const {
        for (const auto& e : entries_)
            if (e.first == key) return &e.second;
        return nullptr;
    }

    bool empty() const noexcept { return entries_.empty(); }
    size_t size() const noexcept { return entries_.size(); }

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

struct CommandDescriptor {
    std::string name;               // unique key, e.g. "entity:query"
    std::string display_name;
    std::string description;
    std::string category = "Utility";
    RiskLevel risk = RiskLevel::Medium;
    bool explicit_confirmation = false;
    OptionSchema options;
};

struct ValidationError {
    ResultCode code = ResultCode::OK;
    std::string key;
    std::optional<RuleName> rule;
    std::string message;
};

// ----------------------------------------------------------------------------
// string conversion
// ----------------------------------------------------------------------------

inline const char* to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low:    return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High:   return "high";
    }
    return "unknown";
}

inline std::optional<RiskLevel> parseRiskLevel(const std::string& s) {
    if (s == "low")    return RiskLevel::Low;
    if (s == "medium") return RiskLevel::Medium;
    if (s == "high")   return RiskLevel::High;
    return std::nullopt;
}

inline const char* to_string(RuleName rule) {
    switch (rule) {
        case RuleName::Integer: return "integer";
        case RuleName::Numeric: return "numeric";
        case RuleName::Min:     return "min";
        case RuleName::Max:     return "max";
    }
    return "unknown";
}

inline const char* to_string(OptionKind kind) {
    switch (kind) {
        case OptionKind::Text:     return "text";
        case OptionKind::LongText: return "textarea";
        case OptionKind::Choice:   return "select";
        case OptionKind::Boolean:  return "checkbox";
    }
    return "unknown";
}

} // namespace command
