#include "test_helpers.h"

class QuantityFlexibilityEvaluatorTest : public ::testing::Test
{
};

TEST_F(QuantityFlexibilityEvaluatorTest, DemandInsideTheBandIsMetExactly)
{
    CalculationResult result = evaluate_or_fail(deterministic_payload(ContractType::QuantityFlexibility));
    EXPECT_DOUBLE_EQ(metric_number(result, "Final Order"), 190.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Overstock"), 0.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Understock"), 0.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Total Cost"), 12920.0);
    EXPECT_EQ(result.key_decision, "Current commitment and flexibility band are well balanced.");
}

TEST_F(QuantityFlexibilityEvaluatorTest, LowDemandHitsTheLowerBound)
{
    CalculationPayload payload = deterministic_payload(ContractType::QuantityFlexibility, "100");
    payload.toggles.include_holding = true;
    payload.toggles.include_salvage = true;
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_DOUBLE_EQ(metric_number(result, "Final Order"), 160.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Overstock"), 60.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Total Cost"), 10520.0);
    EXPECT_EQ(find_metric(result, "Overstock")->tone, MetricTone::Negative);
    EXPECT_EQ(result.key_decision, "Reduce baseline commitment to limit overstock carrying cost.");
}

TEST_F(QuantityFlexibilityEvaluatorTest, HighDemandHitsTheUpperBound)
{
    CalculationPayload payload = deterministic_payload(ContractType::QuantityFlexibility, "300");
    payload.toggles.include_shortage = true;
    payload.toggles.include_penalty = true;
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_DOUBLE_EQ(metric_number(result, "Final Order"), 240.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Understock"), 60.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Total Cost"), 17100.0);
    EXPECT_EQ(result.key_decision, "Increase baseline commitment or flexibility range to reduce understock risk.");
}

TEST_F(QuantityFlexibilityEvaluatorTest, RandomDemandReportsExpectedCost)
{
    CalculationResult result = evaluate_or_fail(uniform_payload(ContractType::QuantityFlexibility, "140", "240"));
    EXPECT_DOUBLE_EQ(metric_number(result, "Expected Total Cost"), 12920.0);
    ASSERT_EQ(result.charts.size(), 2u);
    EXPECT_EQ(result.charts[0].title, "Cost vs Order Commitment");
    EXPECT_EQ(result.charts[1].title, "Cost vs Demand");
}
