#include "test_helpers.h"

class RevenueSharingEvaluatorTest : public ::testing::Test
{
};

TEST_F(RevenueSharingEvaluatorTest, DeterministicProfitSplit)
{
    CalculationResult result = evaluate_or_fail(deterministic_payload(ContractType::RevenueSharing));
    EXPECT_DOUBLE_EQ(metric_number(result, "Retailer Profit"), 3900.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Supplier Profit"), 18900.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Total Supply Chain Profit"), 22800.0);
    EXPECT_EQ(metric_text(result, "Coordination Indicator"), "Strong");
    EXPECT_EQ(result.key_decision, "Current revenue share terms produce balanced incentive alignment.");
}

TEST_F(RevenueSharingEvaluatorTest, ShareOutsideTheBalancedBandIsModerate)
{
    CalculationPayload payload = deterministic_payload(ContractType::RevenueSharing);
    payload.inputs["revenueShareRatio"] = "0.55";
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_EQ(metric_text(result, "Coordination Indicator"), "Moderate");
}

TEST_F(RevenueSharingEvaluatorTest, ExtremeShareIsWeak)
{
    CalculationPayload payload = deterministic_payload(ContractType::RevenueSharing);
    payload.inputs["revenueShareRatio"] = "0.9";
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_EQ(metric_text(result, "Coordination Indicator"), "Weak");
    EXPECT_EQ(result.key_decision, "Revenue split is poorly aligned for this demand profile.");
}

TEST_F(RevenueSharingEvaluatorTest, TotalProfitDoesNotDependOnTheShare)
{
    CalculationPayload payload = deterministic_payload(ContractType::RevenueSharing);
    payload.inputs["revenueShareRatio"] = "0.4";
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_DOUBLE_EQ(metric_number(result, "Total Supply Chain Profit"), 22800.0);
}
