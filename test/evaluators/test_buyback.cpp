#include "test_helpers.h"

class BuybackEvaluatorTest : public ::testing::Test
{
};

TEST_F(BuybackEvaluatorTest, DeterministicProfitSplit)
{
    CalculationResult result = evaluate_or_fail(deterministic_payload(ContractType::Buyback));
    EXPECT_DOUBLE_EQ(metric_number(result, "Retailer Profit"), 9100.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Manufacturer Profit"), 13700.0);
    EXPECT_DOUBLE_EQ(metric_number(result, "Total Profit"), 22800.0);
    EXPECT_EQ(metric_text(result, "Coordination Indicator"), "Strong");
    EXPECT_EQ(result.key_decision, "Current buyback terms create strong coordination incentives.");
}

TEST_F(BuybackEvaluatorTest, ChartsCarryAllThreeSeries)
{
    CalculationResult result = evaluate_or_fail(deterministic_payload(ContractType::Buyback));
    ASSERT_FALSE(result.charts.empty());
    const ChartConfig &chart = result.charts[0];
    EXPECT_EQ(chart.lines.size(), 3u);
    EXPECT_EQ(chart.columns.size(), 4u);
    for (const auto &row : chart.rows)
    {
        ASSERT_EQ(row.size(), 4u);
        const double retailer = std::get<double>(row[1]);
        const double manufacturer = std::get<double>(row[2]);
        const double total = std::get<double>(row[3]);
        EXPECT_NEAR(retailer + manufacturer, total, 0.02);
    }
}

TEST_F(BuybackEvaluatorTest, LowBuybackWeakensCoordination)
{
    CalculationPayload payload = deterministic_payload(ContractType::Buyback);
    payload.inputs["buybackPrice"] = "5";
    CalculationResult result = evaluate_or_fail(payload);
    EXPECT_EQ(metric_text(result, "Coordination Indicator"), "Weak");
    EXPECT_EQ(result.key_decision, "Coordination is weak; revise buyback terms or order quantity.");
}

TEST_F(BuybackEvaluatorTest, RandomDemandUsesExpectedLabels)
{
    CalculationResult result = evaluate_or_fail(uniform_payload(ContractType::Buyback, "140", "240"));
    EXPECT_NE(find_metric(result, "Expected Retailer Profit"), nullptr);
    EXPECT_NE(find_metric(result, "Expected Manufacturer Profit"), nullptr);
    EXPECT_NEAR(metric_number(result, "Expected Retailer Profit") + metric_number(result, "Expected Manufacturer Profit"),
                metric_number(result, "Total Profit"), 0.02);
}
