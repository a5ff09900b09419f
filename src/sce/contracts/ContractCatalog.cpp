#include "include/sce/contracts/ContractCatalog.h"
#include <map>

namespace
{
    // --- Shared field descriptors ---

    FieldDescriptor field(const char *key, const char *display_label, const char *validation_label,
                          bool strictly_positive = false)
    {
        return FieldDescriptor{key, display_label, validation_label, strictly_positive};
    }

    ContractDefinition make_wholesale()
    {
        return ContractDefinition{
            ContractType::Wholesale,
            "Wholesale Price Contract",
            "Retailer commits to an order quantity at a fixed wholesale price. The core decision is balancing stockout risk versus overstock exposure.",
            "Use this module to teach newsvendor logic, critical fractiles, and expected-value decisions under uncertain demand.",
            "Expected Profit",
            {field("retailPrice", "Retail Price (p)", "Retail price"),
             field("wholesalePrice", "Wholesale Price (w)", "Wholesale price"),
             field("orderQuantity", "Order Quantity (Q)", "Order quantity")},
            {{"retailPrice", "120"}, {"wholesalePrice", "70"}, {"orderQuantity", "200"}},
            std::nullopt};
    }

    ContractDefinition make_buyback()
    {
        return ContractDefinition{
            ContractType::Buyback,
            "Buyback Contract",
            "Supplier agrees to repurchase unsold units from the retailer at a buyback price, reducing overstock risk for the retailer.",
            "Compare retailer and manufacturer incentives, then evaluate whether buyback terms improve channel coordination.",
            "Total Supply Chain Profit",
            {field("retailPrice", "Retail Price (p)", "Retail price"),
             field("wholesalePrice", "Wholesale Price (w)", "Wholesale price"),
             field("buybackPrice", "Buyback Price (b)", "Buyback price"),
             field("orderQuantity", "Order Quantity (Q)", "Order quantity")},
            {{"retailPrice", "120"}, {"wholesalePrice", "70"}, {"buybackPrice", "30"}, {"orderQuantity", "200"}},
            std::nullopt};
    }

    ContractDefinition make_revenue_sharing()
    {
        return ContractDefinition{
            ContractType::RevenueSharing,
            "Revenue Sharing Contract",
            "Retailer pays a wholesale price and shares a fraction of sales revenue with the supplier. Profit split shifts with alpha.",
            "Use this contract to discuss incentive alignment and risk transfer by tuning the revenue share ratio.",
            "Total Supply Chain Profit",
            {field("retailPrice", "Retail Price (p)", "Retail price"),
             field("wholesalePrice", "Wholesale Price (w)", "Wholesale price"),
             field("revenueShareRatio", "Revenue Share Ratio (alpha)", "Revenue share ratio"),
             field("orderQuantity", "Order Quantity (Q)", "Order quantity")},
            {{"retailPrice", "120"}, {"wholesalePrice", "60"}, {"revenueShareRatio", "0.25"}, {"orderQuantity", "220"}},
            std::nullopt};
    }

    ContractDefinition make_option_contract()
    {
        OptionModeDefinition modes{
            OptionEvaluationMode::Standard,
            "Standard Evaluation Mode",
            "Optimal Option Quantity Mode (Newsvendor Optimization)",
            {field("reservationPrice", "Reservation Price (Premium)", "Reservation price"),
             field("exercisePrice", "Exercise Price", "Exercise price"),
             field("spotPrice", "Spot Market Price", "Spot price"),
             field("longTermContractPrice", "Long-Term Contract Price", "Long-term contract price"),
             field("meanDemand", "Mean Demand", "Mean demand"),
             field("stdDevDemand", "Standard Deviation", "Standard deviation", true)},
            {{"reservationPrice", "8"},
             {"exercisePrice", "65"},
             {"spotPrice", "90"},
             {"longTermContractPrice", "76"},
             {"meanDemand", "190"},
             {"stdDevDemand", "30"}}};

        return ContractDefinition{
            ContractType::OptionContract,
            "Option Contract",
            "Buyer pays a reservation premium for optional units, then exercises at strike price if market conditions justify it.",
            "Evaluate hedge value versus flexibility by comparing option strategy cost with pure spot purchasing.",
            "Total Cost",
            {field("optionQuantity", "Option Quantity", "Option quantity"),
             field("strikePrice", "Strike Price", "Strike price"),
             field("reservationPrice", "Reservation Price", "Reservation price"),
             field("spotPrice", "Spot Price", "Spot price")},
            {{"optionQuantity", "160"}, {"strikePrice", "65"}, {"reservationPrice", "8"}, {"spotPrice", "90"}},
            modes};
    }

    ContractDefinition make_quantity_flexibility()
    {
        return ContractDefinition{
            ContractType::QuantityFlexibility,
            "Quantity Flexibility Contract",
            "Buyer commits to a baseline volume, then adjusts within an agreed percentage band as demand updates arrive.",
            "This module demonstrates how flexibility windows reduce mismatch cost while preserving supplier planning stability.",
            "Total Cost",
            {field("initialCommitment", "Initial Commitment", "Initial commitment"),
             field("adjustmentRange", "Adjustment Range (%)", "Adjustment range"),
             field("wholesalePrice", "Wholesale Price", "Wholesale price")},
            {{"initialCommitment", "200"}, {"adjustmentRange", "20"}, {"wholesalePrice", "68"}},
            std::nullopt};
    }

    const std::map<ContractType, ContractDefinition> &catalog()
    {
        static const std::map<ContractType, ContractDefinition> definitions = {
            {ContractType::Wholesale, make_wholesale()},
            {ContractType::Buyback, make_buyback()},
            {ContractType::RevenueSharing, make_revenue_sharing()},
            {ContractType::OptionContract, make_option_contract()},
            {ContractType::QuantityFlexibility, make_quantity_flexibility()}};
        return definitions;
    }
}

const ContractDefinition &contract_definition(ContractType type)
{
    return catalog().at(type);
}

const std::vector<FieldDescriptor> &required_fields(ContractType type, OptionEvaluationMode mode)
{
    const ContractDefinition &definition = contract_definition(type);
    if (definition.option_modes && mode == OptionEvaluationMode::Optimization)
    {
        return definition.option_modes->optimization_fields;
    }
    return definition.fields;
}

CalculationPayload make_default_payload(ContractType type, std::optional<OptionEvaluationMode> mode)
{
    const ContractDefinition &definition = contract_definition(type);
    const OptionEvaluationMode resolved_mode = mode.value_or(
        definition.option_modes ? definition.option_modes->default_mode : OptionEvaluationMode::Standard);

    CalculationPayload payload;
    payload.contract_type = type;
    payload.option_evaluation_mode = resolved_mode;

    const DefaultInputs &defaults = (definition.option_modes && resolved_mode == OptionEvaluationMode::Optimization)
                                        ? definition.option_modes->default_optimization_inputs
                                        : definition.default_inputs;
    for (const auto &[key, value] : defaults)
    {
        payload.inputs[key] = value;
    }

    payload.demand_settings.demand_type = DemandType::Deterministic;
    payload.demand_settings.distribution_type = DistributionType::Normal;
    payload.demand_settings.demand = "190";
    payload.demand_settings.mean = "190";
    payload.demand_settings.std_dev = "30";
    payload.demand_settings.lower_bound = "140";
    payload.demand_settings.upper_bound = "240";
    payload.demand_settings.discrete_values = "150, 190, 230";
    payload.demand_settings.discrete_probabilities = "0.25, 0.5, 0.25";

    payload.cost_inputs.salvage_value = "10";
    payload.cost_inputs.holding_cost = "4";
    payload.cost_inputs.shortage_cost = "7";
    payload.cost_inputs.penalty_cost = "6";

    return payload;
}
