#include "command.hpp"

#include "command_helper.hpp"
#include "policy/risk_policy.hpp"

namespace command {

namespace {

nlohmann::ordered_json anyToJson(const std::any& value) {
    if (!value.has_value()) return nullptr;
    if (value.type() == typeid(bool)) return std::any_cast<bool>(value);
    if (auto n = CommandHelper::asNumber(value); n && value.type() != typeid(std::string)) return *n;
    return CommandHelper::asText(value);
}

} // namespace

bool Command::requiresConfirmation() const {
    return policy::requiresConfirmation(descriptor_.risk, descriptor_.explicit_confirmation);
}

Result<void, ValidationError> Command::validateOptions(const OptionValues& values) const {
    return CommandHelper::validate(values, descriptor_.options);
}

nlohmann::ordered_json Command::toConfig() const {
    nlohmann::ordered_json j;
    j["name"] = descriptor_.display_name;
    j["description"] = descriptor_.description;
    j["category"] = descriptor_.category;
    j["danger_level"] = to_string(descriptor_.risk);
    j["requires_confirmation"] = requiresConfirmation();

    auto options = nlohmann::ordered_json::object();
    for (const auto& [key, spec] : descriptor_.options) {
        nlohmann::ordered_json o;
        o["type"] = to_string(spec.kind);
        o["label"] = spec.label;
        o["required"] = spec.required;
        o["default"] = anyToJson(spec.default_value);
        if (spec.numeric) o["numeric"] = true;

        if (!spec.rules.empty()) {
            std::string rules;
            for (const auto& rule : spec.rules) {
                if (!rules.empty()) rules += '|';
                rules += to_string(rule.name);
                if (rule.arg) rules += ":" + std::to_string(*rule.arg);
            }
            o["validation"] = rules;
        }
        if (spec.kind == OptionKind::Choice) {
            auto choices = nlohmann::ordered_json::object();
            for (const auto& [k, label] : spec.resolvedChoices()) choices[k] = label;
            o["options"] = choices;
        }
        if (!spec.help.empty()) o["help"] = spec.help;
        if (!spec.placeholder.empty()) o["placeholder"] = spec.placeholder;
        options[key] = o;
    }
    j["options"] = options;
    return j;
}

} // namespace command
