#include "risk_policy.hpp"

namespace policy {

namespace {
constexpr const char* kProduction = "production";
}

const char* to_string(Visibility v) {
    switch (v) {
        case Visibility::Enabled:  return "enabled";
        case Visibility::Disabled: return "disabled";
        case Visibility::Hidden:   return "hidden";
    }
    return "unknown";
}

const EnvironmentRestriction* EnvironmentPolicy::restriction(const std::string& environment) const {
    auto it = restrictions_.find(environment);
    return it == restrictions_.end() ? nullptr : &it->second;
}

bool EnvironmentPolicy::isEligible(const command::CommandDescriptor& descriptor,
                                   const std::string& environment) const {
    const auto* r = restriction(environment);
    if (!r) return true;
    return r->allowed_risk_levels.count(descriptor.risk) > 0;
}

Visibility EnvironmentPolicy::visibility(const command::CommandDescriptor& descriptor,
                                         const std::string& environment) const {
    if (isEligible(descriptor, environment)) return Visibility::Enabled;
    const auto* r = restriction(environment);
    return (r && r->disable_unless_confirmed) ? Visibility::Hidden : Visibility::Disabled;
}

bool EnvironmentPolicy::confirmationRequired(const command::CommandDescriptor& descriptor,
                                             const std::string& environment) const {
    if (requiresConfirmation(descriptor.risk, descriptor.explicit_confirmation)) return true;
    return confirm_in_production_ && environment == kProduction;
}

} // namespace policy
