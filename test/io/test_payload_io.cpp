#include "test_helpers.h"

class PayloadIoTest : public ::testing::Test
{
};

TEST_F(PayloadIoTest, ReadsCamelCaseDocument)
{
    json document = json::parse(R"({
        "contractType": "optionContract",
        "optionEvaluationMode": "optimization",
        "inputs": {"reservationPrice": "8", "exercisePrice": 65, "spotPrice": 90.5},
        "demandSettings": {"demandType": "random", "distributionType": "discrete",
                           "discreteValues": "150, 190", "discreteProbabilities": "0.5, 0.5"},
        "toggles": {"includeHolding": true},
        "costInputs": {"holdingCost": "4"}
    })");
    CalculationPayload payload = payload_from_json(document);

    EXPECT_EQ(payload.contract_type, ContractType::OptionContract);
    EXPECT_EQ(payload.option_evaluation_mode, OptionEvaluationMode::Optimization);
    EXPECT_EQ(payload.inputs.at("reservationPrice"), "8");
    EXPECT_EQ(payload.inputs.at("exercisePrice"), "65");
    EXPECT_EQ(payload.inputs.at("spotPrice"), "90.5");
    EXPECT_EQ(payload.demand_settings.demand_type, DemandType::Random);
    EXPECT_EQ(payload.demand_settings.distribution_type, DistributionType::Discrete);
    EXPECT_EQ(payload.demand_settings.discrete_values, "150, 190");
    EXPECT_TRUE(payload.toggles.include_holding);
    EXPECT_FALSE(payload.toggles.include_salvage);
    EXPECT_EQ(payload.cost_inputs.holding_cost, "4");
    EXPECT_EQ(payload.cost_inputs.salvage_value, "");
}

TEST_F(PayloadIoTest, OmittedSectionsTakeDefaults)
{
    CalculationPayload payload = payload_from_json(json::parse(R"({"contractType": "buyback"})"));
    EXPECT_EQ(payload.option_evaluation_mode, OptionEvaluationMode::Standard);
    EXPECT_TRUE(payload.inputs.empty());
    EXPECT_EQ(payload.demand_settings.demand_type, DemandType::Deterministic);

    CalculationResponse response = calculate_contract(payload);
    EXPECT_FALSE(response.result.has_value());
    EXPECT_EQ(response.errors.size(), 5u);
}

TEST_F(PayloadIoTest, RejectsNonScalarInputs)
{
    json document = json::parse(R"({"contractType": "wholesale", "inputs": {"retailPrice": [120]}})");
    try
    {
        payload_from_json(document, 3);
        FAIL() << "Expected EngineException for an array input.";
    }
    catch (const EngineException &e)
    {
        EXPECT_EQ(e.code(), EngineErrc::PayloadConfigError);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("Scenario 4: Field 'retailPrice'"));
    }
}

TEST_F(PayloadIoTest, TemplateSurvivesTheRoundTrip)
{
    CalculationPayload original = make_default_payload(ContractType::QuantityFlexibility);
    original.toggles.include_penalty = true;
    CalculationPayload restored = payload_from_json(payload_to_json(original));

    EXPECT_EQ(restored.contract_type, original.contract_type);
    EXPECT_EQ(restored.inputs, original.inputs);
    EXPECT_EQ(restored.demand_settings.discrete_probabilities, original.demand_settings.discrete_probabilities);
    EXPECT_TRUE(restored.toggles.include_penalty);
    EXPECT_EQ(restored.cost_inputs.penalty_cost, "6");
}

TEST_F(PayloadIoTest, ResponseJsonUsesWireNames)
{
    json out = response_to_json(calculate_contract(make_default_payload(ContractType::OptionContract, OptionEvaluationMode::Optimization)));

    ASSERT_TRUE(out["result"].is_object());
    EXPECT_TRUE(out["errors"].empty());
    const json &result = out["result"];
    EXPECT_EQ(result["metricsSectionTitle"], "Optimization Results");
    EXPECT_FALSE(result.contains("warnings"));
    ASSERT_EQ(result["metrics"].size(), 9u);
    EXPECT_EQ(result["metrics"][8]["label"], "Recommended Strategy");
    EXPECT_EQ(result["metrics"][8]["value"], "Use Option Contract");
    EXPECT_EQ(result["metrics"][8]["tone"], "positive");
    EXPECT_EQ(result["metrics"][8]["emphasize"], true);

    const json &curve = result["charts"][0];
    EXPECT_EQ(curve["chartType"], "line");
    EXPECT_EQ(curve["xKey"], "optionQuantity");
    EXPECT_TRUE(curve["data"][0].contains("optionQuantity"));
    EXPECT_TRUE(curve["data"][0].contains("expectedCost"));
    EXPECT_EQ(curve["referenceX"]["label"], "Optimal Q*");

    const json &bars = result["charts"][1];
    EXPECT_EQ(bars["chartType"], "bar");
    EXPECT_FALSE(bars.contains("lines"));
    EXPECT_EQ(bars["data"][0]["category"], "Expected Cost");
    EXPECT_EQ(bars["bars"][1]["dataKey"], "longTermContract");
}

TEST_F(PayloadIoTest, FailedResponseHasNullResult)
{
    CalculationPayload payload = make_default_payload(ContractType::Wholesale);
    payload.inputs["retailPrice"] = "n/a";
    json out = response_to_json(calculate_contract(payload));
    EXPECT_TRUE(out["result"].is_null());
    ASSERT_EQ(out["errors"].size(), 1u);
    EXPECT_EQ(out["errors"][0], "Retail price must be a valid number.");
}
