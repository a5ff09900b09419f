#include "test_helpers.h"

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class WholesaleEvaluatorTest : public ::testing::Test
{
};

TEST_F(WholesaleEvaluatorTest, DeterministicNewsvendorScenario)
{
    CalculationResult result = evaluate_or_fail(deterministic_payload(ContractType::Wholesale));

    EXPECT_DOUBLE_EQ(metric_number(result, "Profit"), 8800.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Service Level"), 100.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Leftover Inventory"), 10.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Optimal Q"), 190.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Critical Fractile"), 0.42);
    EXPECT_EQ(result.key_decision, "Reduce order quantity toward 190 units to limit overstock risk.");

    const MetricCard *profit = find_metric(result, "Profit");
    ASSERT_NE(profit, nullptr);
    EXPECT_TRUE(profit->emphasize);
    EXPECT_EQ(profit->tone, MetricTone::Positive);
    EXPECT_THAT(result.notes, ElementsAre("Service level is fulfilled demand divided by realized demand."));
}

TEST_F(WholesaleEvaluatorTest, SensitivityChartsSpanTwiceTheAnchor)
{
    CalculationResult result = evaluate_or_fail(deterministic_payload(ContractType::Wholesale));
    ASSERT_EQ(result.charts.size(), 2u);

    const ChartConfig &by_quantity = result.charts[0];
    EXPECT_EQ(by_quantity.title, "Profit vs Order Quantity");
    EXPECT_THAT(by_quantity.columns, ElementsAre("quantity", "profit"));
    ASSERT_EQ(by_quantity.rows.size(), static_cast<size_t>(kSensitivityPoints));
    EXPECT_EQ(chart_value(by_quantity, 0, "quantity"), 0.0);
    EXPECT_EQ(chart_value(by_quantity, kSensitivityPoints - 1, "quantity"), 400.0);
    EXPECT_EQ(chart_value(by_quantity, kSensitivityPoints - 1, "profit"), -5200.0);

    const ChartConfig &by_demand = result.charts[1];
    EXPECT_EQ(by_demand.title, "Profit vs Demand");
    EXPECT_EQ(chart_value(by_demand, 0, "profit"), -14000.0);
    EXPECT_EQ(chart_value(by_demand, kSensitivityPoints - 1, "profit"), 10000.0);
    EXPECT_FALSE(chart_value(by_demand, 0, "missing").has_value());
}

TEST_F(WholesaleEvaluatorTest, SalvageAndHoldingAdjustProfitWhenEnabled)
{
    CalculationPayload payload = deterministic_payload(ContractType::Wholesale);
    payload.toggles.include_salvage = true;
    payload.toggles.include_holding = true;
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_DOUBLE_EQ(metric_number(result, "Profit"), 8860.0);
}

TEST_F(WholesaleEvaluatorTest, UnderOrderingAsksForMoreStock)
{
    CalculationPayload payload = deterministic_payload(ContractType::Wholesale);
    payload.inputs["orderQuantity"] = "150";
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_EQ(result.key_decision, "Increase order quantity toward 190 units to improve service performance.");
    EXPECT_NEAR(metric_number(result, "Service Level"), 78.95, 1e-9);
}

TEST_F(WholesaleEvaluatorTest, OrderNearOptimumIsReportedAsSuch)
{
    CalculationPayload payload = deterministic_payload(ContractType::Wholesale);
    payload.inputs["orderQuantity"] = "190.5";
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_EQ(result.key_decision, "Current order quantity is near the model-optimal level.");
}

TEST_F(WholesaleEvaluatorTest, NormalDemandUsesCriticalFractileQuantile)
{
    CalculationResult result = evaluate_or_fail(normal_payload(ContractType::Wholesale, "190", "30"));
    EXPECT_NEAR(metric_number(result, "Optimal Q"), 183.69, 0.011);
    EXPECT_THAT(result.key_decision, HasSubstr("Reduce order quantity toward 183.69"));
    EXPECT_NE(find_metric(result, "Expected Profit"), nullptr);
    EXPECT_EQ(find_metric(result, "Profit"), nullptr);
    EXPECT_EQ(result.notes.size(), 2u);
}

TEST_F(WholesaleEvaluatorTest, DiscreteDemandPicksSupportPoint)
{
    CalculationResult result = evaluate_or_fail(discrete_payload(ContractType::Wholesale, "230, 150, 190", "0.25, 0.25, 0.5"));
    EXPECT_DOUBLE_EQ(metric_number(result, "Optimal Q"), 190.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Service Level"), 75.0);
}
