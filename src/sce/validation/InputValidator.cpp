#include "include/sce/validation/InputValidator.h"
#include "include/sce/validation/DemandContextResolver.h"
#include "include/sce/validation/number_parsing.h"
#include "include/sce/contracts/ContractCatalog.h"

namespace
{
    bool is_option_optimization(const CalculationPayload &payload)
    {
        return payload.contract_type == ContractType::OptionContract &&
               payload.option_evaluation_mode == OptionEvaluationMode::Optimization;
    }

    double parse_cost(const std::string &raw, const std::string &label, bool enabled, std::vector<std::string> &errors)
    {
        if (!enabled)
        {
            return 0.0;
        }
        return parse_number(raw, label, errors).value_or(0.0);
    }

    std::optional<double> lookup(const std::map<std::string, double> &values, const std::string &key)
    {
        auto it = values.find(key);
        if (it == values.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void apply_business_rules(ContractType type, const std::map<std::string, double> &inputs,
                              std::vector<std::string> &errors)
    {
        switch (type)
        {
        case ContractType::RevenueSharing:
        {
            const auto alpha = lookup(inputs, "revenueShareRatio");
            if (alpha && (*alpha < 0 || *alpha > 1))
            {
                errors.push_back("Revenue share ratio must be between 0 and 1.");
            }
            break;
        }
        case ContractType::QuantityFlexibility:
        {
            const auto range = lookup(inputs, "adjustmentRange");
            if (range && (*range < 0 || *range > 100))
            {
                errors.push_back("Adjustment range must be between 0 and 100.");
            }
            break;
        }
        case ContractType::Buyback:
        {
            const auto buyback = lookup(inputs, "buybackPrice");
            const auto wholesale = lookup(inputs, "wholesalePrice");
            if (buyback && wholesale && *buyback > *wholesale)
            {
                errors.push_back("Buyback price should not exceed wholesale price in a standard buyback contract.");
            }
            break;
        }
        case ContractType::Wholesale:
        case ContractType::OptionContract:
            break;
        }
    }
}

ValidationOutcome validate_and_parse_payload(const CalculationPayload &payload)
{
    ValidationOutcome outcome;
    std::vector<std::string> &errors = outcome.errors;
    std::map<std::string, double> parsed_inputs;

    for (const FieldDescriptor &field : required_fields(payload.contract_type, payload.option_evaluation_mode))
    {
        auto raw = payload.inputs.find(field.key);
        if (raw == payload.inputs.end())
        {
            errors.push_back(field.validation_label + " must be a valid number.");
            continue;
        }
        if (auto value = parse_number(raw->second, field.validation_label, errors, field.strictly_positive))
        {
            parsed_inputs[field.key] = *value;
        }
    }

    apply_business_rules(payload.contract_type, parsed_inputs, errors);

    // Optimization mode carries its own demand model in meanDemand/stdDevDemand.
    std::optional<ParsedDemandContext> demand_context;
    if (is_option_optimization(payload))
    {
        demand_context = DeterministicDemand{lookup(parsed_inputs, "meanDemand").value_or(0.0)};
    }
    else
    {
        demand_context = resolve_demand_context(payload.demand_settings, errors);
    }

    ResolvedCosts costs;
    costs.salvage_value = parse_cost(payload.cost_inputs.salvage_value, "Salvage value", payload.toggles.include_salvage, errors);
    costs.holding_cost = parse_cost(payload.cost_inputs.holding_cost, "Holding cost", payload.toggles.include_holding, errors);
    costs.shortage_cost = parse_cost(payload.cost_inputs.shortage_cost, "Shortage cost", payload.toggles.include_shortage, errors);
    costs.penalty_cost = parse_cost(payload.cost_inputs.penalty_cost, "Penalty cost", payload.toggles.include_penalty, errors);

    if (!errors.empty() || !demand_context)
    {
        return outcome;
    }

    outcome.parsed = ParsedCalculationPayload{
        payload.contract_type,
        payload.option_evaluation_mode,
        std::move(parsed_inputs),
        std::move(*demand_context),
        payload.toggles,
        costs};
    return outcome;
}
