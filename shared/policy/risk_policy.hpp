#pragma once
#include <map>
#include <set>
#include <string>
#include <utility>

#include "command/command_def.hpp"

namespace policy {

// Medium and High always confirm; Low only when the author asked for it.
constexpr bool requiresConfirmation(command::RiskLevel risk, bool explicit_flag) noexcept {
    return explicit_flag || risk != command::RiskLevel::Low;
}

struct EnvironmentRestriction {
    std::set<command::RiskLevel> allowed_risk_levels;
    bool disable_unless_confirmed = false;
};

enum class Visibility {
    Enabled,    // eligible
    Disabled,   // shown, not runnable
    Hidden      // excluded from the catalog
};

const char* to_string(Visibility v);

// Evaluated on every call; nothing is cached across environment changes.
class EnvironmentPolicy {
public:
    EnvironmentPolicy() = default;
    EnvironmentPolicy(std::map<std::string, EnvironmentRestriction> restrictions,
                      bool confirm_in_production)
        : restrictions_(std::move(restrictions)),
          confirm_in_production_(confirm_in_production) {}

    void setRestriction(const std::string& environment, EnvironmentRestriction restriction) {
        restrictions_[environment] = std::move(restriction);
    }

    const EnvironmentRestriction* restriction(const std::string& environment) const;

    // No restriction configured for the environment means every level is allowed.
    bool isEligible(const command::CommandDescriptor& descriptor,
                    const std::string& environment) const;

    Visibility visibility(const command::CommandDescriptor& descriptor,
                          const std::string& environment) const;

    bool confirmationRequired(const command::CommandDescriptor& descriptor,
                              const std::string& environment) const;

private:
    std::map<std::string, EnvironmentRestriction> restrictions_;
    bool confirm_in_production_ = true;
};

} // namespace policy
