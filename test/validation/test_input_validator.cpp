#include "test_helpers.h"
#include "include/sce/validation/InputValidator.h"

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class InputValidatorTest : public ::testing::Test
{
};

TEST_F(InputValidatorTest, DefaultPayloadsValidateForEveryContract)
{
    for (ContractType type : all_contract_types())
    {
        SCOPED_TRACE(to_string(type));
        ValidationOutcome outcome = validate_and_parse_payload(make_default_payload(type));
        EXPECT_THAT(outcome.errors, IsEmpty());
        EXPECT_TRUE(outcome.parsed.has_value());
    }
    ValidationOutcome optimization = validate_and_parse_payload(
        make_default_payload(ContractType::OptionContract, OptionEvaluationMode::Optimization));
    EXPECT_THAT(optimization.errors, IsEmpty());
}

TEST_F(InputValidatorTest, ParsedInputsCarryNumericValues)
{
    ValidationOutcome outcome = validate_and_parse_payload(make_default_payload(ContractType::Buyback));
    ASSERT_TRUE(outcome.parsed.has_value());
    EXPECT_DOUBLE_EQ(outcome.parsed->input("retailPrice"), 120.0);
    EXPECT_DOUBLE_EQ(outcome.parsed->input("buybackPrice"), 30.0);
    EXPECT_FALSE(outcome.parsed->is_random_demand());
}

TEST_F(InputValidatorTest, EmptyDiscreteValuesProduceExactlyOneError)
{
    CalculationPayload payload = discrete_payload(ContractType::Wholesale, "", "0.25, 0.5, 0.25");
    ValidationOutcome outcome = validate_and_parse_payload(payload);
    EXPECT_THAT(outcome.errors, ElementsAre("Discrete demand values and probabilities cannot be empty."));
    EXPECT_FALSE(outcome.parsed.has_value());
}

TEST_F(InputValidatorTest, MissingAndInvalidFieldsAccumulate)
{
    CalculationPayload payload = make_default_payload(ContractType::Wholesale);
    payload.inputs.erase("retailPrice");
    payload.inputs["orderQuantity"] = "-200";
    payload.demand_settings.demand = "lots";
    ValidationOutcome outcome = validate_and_parse_payload(payload);
    EXPECT_THAT(outcome.errors, ElementsAre("Retail price must be a valid number.",
                                            "Order quantity cannot be negative.",
                                            "Demand must be a valid number."));
    EXPECT_FALSE(outcome.parsed.has_value());
}

TEST_F(InputValidatorTest, BlankFieldsAndEnabledCostsParseAsZero)
{
    CalculationPayload payload = make_default_payload(ContractType::Wholesale);
    payload.inputs["orderQuantity"] = "";
    payload.toggles.include_salvage = true;
    payload.cost_inputs.salvage_value = "  ";
    ValidationOutcome outcome = validate_and_parse_payload(payload);
    EXPECT_THAT(outcome.errors, IsEmpty());
    ASSERT_TRUE(outcome.parsed.has_value());
    EXPECT_DOUBLE_EQ(outcome.parsed->input("orderQuantity"), 0.0);
    EXPECT_DOUBLE_EQ(outcome.parsed->costs.salvage_value, 0.0);
}

TEST_F(InputValidatorTest, RevenueShareRatioMustBeAFraction)
{
    CalculationPayload payload = make_default_payload(ContractType::RevenueSharing);
    payload.inputs["revenueShareRatio"] = "1.2";
    EXPECT_THAT(validate_and_parse_payload(payload).errors,
                ElementsAre("Revenue share ratio must be between 0 and 1."));
}

TEST_F(InputValidatorTest, AdjustmentRangeIsAPercentage)
{
    CalculationPayload payload = make_default_payload(ContractType::QuantityFlexibility);
    payload.inputs["adjustmentRange"] = "120";
    EXPECT_THAT(validate_and_parse_payload(payload).errors,
                ElementsAre("Adjustment range must be between 0 and 100."));
}

TEST_F(InputValidatorTest, BuybackAboveWholesaleIsRejected)
{
    CalculationPayload payload = make_default_payload(ContractType::Buyback);
    payload.inputs["buybackPrice"] = "80";
    ValidationOutcome outcome = validate_and_parse_payload(payload);
    EXPECT_THAT(outcome.errors,
                ElementsAre("Buyback price should not exceed wholesale price in a standard buyback contract."));
    EXPECT_FALSE(outcome.parsed.has_value());
}

TEST_F(InputValidatorTest, DisabledCostsAreZeroWhateverTheirText)
{
    CalculationPayload payload = make_default_payload(ContractType::Wholesale);
    payload.cost_inputs.salvage_value = "not a number";
    payload.cost_inputs.holding_cost = "-4";
    ValidationOutcome outcome = validate_and_parse_payload(payload);
    ASSERT_TRUE(outcome.parsed.has_value());
    EXPECT_DOUBLE_EQ(outcome.parsed->costs.salvage_value, 0.0);
    EXPECT_DOUBLE_EQ(outcome.parsed->costs.holding_cost, 0.0);
}

TEST_F(InputValidatorTest, EnabledCostsAreParsed)
{
    CalculationPayload payload = make_default_payload(ContractType::Wholesale);
    payload.toggles.include_shortage = true;
    payload.toggles.include_penalty = true;
    payload.cost_inputs.penalty_cost = "-6";
    ValidationOutcome outcome = validate_and_parse_payload(payload);
    EXPECT_THAT(outcome.errors, ElementsAre("Penalty cost cannot be negative."));

    payload.cost_inputs.penalty_cost = "6";
    outcome = validate_and_parse_payload(payload);
    ASSERT_TRUE(outcome.parsed.has_value());
    EXPECT_DOUBLE_EQ(outcome.parsed->costs.shortage_cost, 7.0);
    EXPECT_DOUBLE_EQ(outcome.parsed->costs.penalty_cost, 6.0);
}

TEST_F(InputValidatorTest, OptimizationModeIgnoresDemandSettings)
{
    CalculationPayload payload = make_default_payload(ContractType::OptionContract, OptionEvaluationMode::Optimization);
    payload.demand_settings.demand = "garbage";
    ValidationOutcome outcome = validate_and_parse_payload(payload);
    ASSERT_TRUE(outcome.parsed.has_value());
    ASSERT_TRUE(std::holds_alternative<DeterministicDemand>(outcome.parsed->demand_context));
    EXPECT_DOUBLE_EQ(std::get<DeterministicDemand>(outcome.parsed->demand_context).demand, 190.0);
}

TEST_F(InputValidatorTest, OptimizationModeRequiresPositiveStandardDeviation)
{
    CalculationPayload payload = make_default_payload(ContractType::OptionContract, OptionEvaluationMode::Optimization);
    payload.inputs["stdDevDemand"] = "0";
    EXPECT_THAT(validate_and_parse_payload(payload).errors,
                Contains("Standard deviation must be greater than 0."));
}

TEST_F(InputValidatorTest, StandardOptionModeDoesNotRequireOptimizationFields)
{
    CalculationPayload payload = make_default_payload(ContractType::OptionContract);
    EXPECT_EQ(payload.inputs.count("longTermContractPrice"), 0u);
    EXPECT_THAT(validate_and_parse_payload(payload).errors, IsEmpty());
}
