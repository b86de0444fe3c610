#include "command_helper.hpp"

#include <cmath>
#include <cstdint>

#include <fmt/core.h>

#include "common/string_helper.hpp"

namespace command {

namespace {

Result<void, ValidationError> violation(const std::string& key, RuleName rule, std::string message) {
    return Result<void, ValidationError>::Error(ResultCode::RuleViolation,
        ValidationError{ResultCode::RuleViolation, key, rule, std::move(message)});
}

} // namespace

bool CommandHelper::isEmpty(const std::any& value) {
    if (!value.has_value()) return true;
    if (value.type() == typeid(std::string)) return std::any_cast<const std::string&>(value).empty();
    if (value.type() == typeid(const char*)) {
        const char* s = std::any_cast<const char*>(value);
        return s == nullptr || *s == '\0';
    }
    if (value.type() == typeid(bool)) return !std::any_cast<bool>(value);
    return false;
}

bool CommandHelper::isEmpty(const OptionValues& values, const std::string& key) {
    auto it = values.find(key);
    return it == values.end() || isEmpty(it->second);
}

std::optional<double> CommandHelper::asNumber(const std::any& value) {
    if (!value.has_value()) return std::nullopt;
    const auto& t = value.type();
    if (t == typeid(int))       return static_cast<double>(std::any_cast<int>(value));
    if (t == typeid(long))      return static_cast<double>(std::any_cast<long>(value));
    if (t == typeid(long long)) return static_cast<double>(std::any_cast<long long>(value));
    if (t == typeid(double))    return std::any_cast<double>(value);
    if (t == typeid(float))     return static_cast<double>(std::any_cast<float>(value));
    if (t == typeid(std::string)) return parseNumber(std::any_cast<const std::string&>(value));
    if (t == typeid(const char*)) return parseNumber(std::any_cast<const char*>(value));
    return std::nullopt;
}

std::string CommandHelper::asText(const std::any& value) {
    if (!value.has_value()) return {};
    const auto& t = value.type();
    if (t == typeid(std::string)) return std::any_cast<const std::string&>(value);
    if (t == typeid(const char*)) return std::any_cast<const char*>(value);
    if (t == typeid(bool))        return std::any_cast<bool>(value) ? "true" : "false";
    if (t == typeid(int))         return std::to_string(std::any_cast<int>(value));
    if (t == typeid(long))        return std::to_string(std::any_cast<long>(value));
    if (t == typeid(long long))   return std::to_string(std::any_cast<long long>(value));
    if (t == typeid(double))      return fmt::format("{}", std::any_cast<double>(value));
    if (t == typeid(float))       return fmt::format("{}", std::any_cast<float>(value));
    return {};
}

bool CommandHelper::asBool(const std::any& value) {
    if (!value.has_value()) return false;
    if (value.type() == typeid(bool)) return std::any_cast<bool>(value);
    if (auto n = asNumber(value)) return *n != 0.0;
    auto text = toLower(asText(value));
    return text == "true" || text == "yes" || text == "on";
}

OptionValues CommandHelper::collect(const OptionValues& values, const OptionSchema& schema) {
    OptionValues out;
    for (const auto& [key, spec] : schema) {
        auto it = values.find(key);
        if (it != values.end() && it->second.has_value()) {
            out[key] = it->second;
        } else if (spec.hasDefault()) {
            // 기본값 적용
            out[key] = spec.default_value;
        }
    }
    return out;
}

Result<void, ValidationError> CommandHelper::validate(const OptionValues& values,
                                                      const OptionSchema& schema) {
    for (const auto& [key, spec] : schema) {
        auto it = values.find(key);
        bool empty = (it == values.end()) || isEmpty(it->second);

        if (spec.required && empty) {
            const auto& label = spec.label.empty() ? key : spec.label;
            return Result<void, ValidationError>::Error(ResultCode::MissingRequired,
                ValidationError{ResultCode::MissingRequired, key, std::nullopt,
                                fmt::format("Option '{}' is required", label)});
        }

        if (empty) continue;

        if (spec.kind == OptionKind::Choice) {
            auto r = checkChoice(key, spec, it->second);
            if (!r) return r;
        }

        if (spec.rules.empty()) continue;

        for (const auto& rule : spec.rules) {
            auto r = applyRule(key, it->second, rule);
            if (!r) return r;
        }
    }
    return Result<void, ValidationError>::OK();
}

// The value must be one of the keys offered to the form.
Result<void, ValidationError> CommandHelper::checkChoice(const std::string& key, const OptionSpec& spec,
                                                         const std::any& value) {
    const auto text = asText(value);
    const auto choices = spec.resolvedChoices();
    for (const auto& choice : choices) {
        if (choice.first == text) return Result<void, ValidationError>::OK();
    }

    std::string allowed;
    for (const auto& choice : choices) {
        if (!allowed.empty()) allowed += ", ";
        allowed += choice.first;
    }
    const auto& label = spec.label.empty() ? key : spec.label;
    return Result<void, ValidationError>::Error(ResultCode::InvalidChoice,
        ValidationError{ResultCode::InvalidChoice, key, std::nullopt,
                        fmt::format("Option '{}' must be one of: {}", label, allowed)});
}

Result<void, ValidationError> CommandHelper::applyRule(const std::string& key,
                                                       const std::any& value,
                                                       const Rule& rule) {
    auto number = asNumber(value);

    switch (rule.name) {
        case RuleName::Integer:
            if (!number || std::trunc(*number) != *number)
                return violation(key, rule.name, fmt::format("Option '{}' must be an integer", key));
            break;
        case RuleName::Numeric:
            if (!number)
                return violation(key, rule.name, fmt::format("Option '{}' must be numeric", key));
            break;
        case RuleName::Min: {
            // non-numeric values are left to Integer / Numeric
            long long bound = rule.arg.value_or(0);
            if (number && *number < static_cast<double>(bound))
                return violation(key, rule.name, fmt::format("Option '{}' must be at least {}", key, bound));
            break;
        }
        case RuleName::Max: {
            long long bound = rule.arg.value_or(0);
            if (number && *number > static_cast<double>(bound))
                return violation(key, rule.name, fmt::format("Option '{}' must not exceed {}", key, bound));
            break;
        }
    }
    return Result<void, ValidationError>::OK();
}

} // namespace command
