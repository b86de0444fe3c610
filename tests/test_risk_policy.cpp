#include <gtest/gtest.h>

#include "policy/risk_policy.hpp"
#include "test_support.hpp"

using command::RiskLevel;
using namespace policy;
using testing_support::descriptor;

static_assert(!requiresConfirmation(RiskLevel::Low, false), "low without flag");
static_assert(requiresConfirmation(RiskLevel::Low, true), "low with flag");
static_assert(requiresConfirmation(RiskLevel::Medium, false), "medium");
static_assert(requiresConfirmation(RiskLevel::High, false), "high");

TEST(RiskPolicyTest, NoRestrictionMeansEveryLevelIsEligible) {
    EnvironmentPolicy policy;
    for (auto level : {RiskLevel::Low, RiskLevel::Medium, RiskLevel::High}) {
        EXPECT_TRUE(policy.isEligible(descriptor("c", level), "local"));
        EXPECT_EQ(policy.visibility(descriptor("c", level), "local"), Visibility::Enabled);
    }
}

TEST(RiskPolicyTest, RestrictionLimitsLevels) {
    EnvironmentPolicy policy;
    policy.setRestriction("production", {{RiskLevel::Low}, false});

    EXPECT_TRUE(policy.isEligible(descriptor("c", RiskLevel::Low), "production"));
    EXPECT_FALSE(policy.isEligible(descriptor("c", RiskLevel::Medium), "production"));
    EXPECT_EQ(policy.visibility(descriptor("c", RiskLevel::High), "production"), Visibility::Disabled);

    // other environments are unaffected
    EXPECT_TRUE(policy.isEligible(descriptor("c", RiskLevel::High), "staging"));
}

TEST(RiskPolicyTest, DisableUnlessConfirmedHidesIneligible) {
    EnvironmentPolicy policy;
    policy.setRestriction("production", {{RiskLevel::Low}, true});
    EXPECT_EQ(policy.visibility(descriptor("c", RiskLevel::High), "production"), Visibility::Hidden);
    EXPECT_EQ(policy.visibility(descriptor("c", RiskLevel::Low), "production"), Visibility::Enabled);
    EXPECT_STREQ(to_string(Visibility::Hidden), "hidden");
}

TEST(RiskPolicyTest, ConfirmationRequired) {
    EnvironmentPolicy confirm_prod({}, true);
    auto low = descriptor("c", RiskLevel::Low);
    EXPECT_FALSE(confirm_prod.confirmationRequired(low, "staging"));
    EXPECT_TRUE(confirm_prod.confirmationRequired(low, "production"));
    EXPECT_TRUE(confirm_prod.confirmationRequired(descriptor("c", RiskLevel::Medium), "staging"));

    EnvironmentPolicy relaxed({}, false);
    EXPECT_FALSE(relaxed.confirmationRequired(low, "production"));

    low.explicit_confirmation = true;
    EXPECT_TRUE(relaxed.confirmationRequired(low, "staging"));
}
