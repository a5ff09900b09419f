#include "include/sce/evaluators/OptionContractEvaluator.h"
#include "include/sce/evaluators/evaluators_registration.h"
#include "include/sce/evaluators/order_stats.h"
#include "include/sce/results/ResultAssembler.h"
#include "include/sce/distributions/demand_math.h"
#include <algorithm>

void register_option_contract_evaluator(EvaluatorRegistry &registry)
{
    registry.register_evaluator(ContractType::OptionContract, []
                                { return std::make_unique<OptionContractEvaluator>(); });
}

namespace
{
    struct OptionPosition
    {
        double option_quantity;
        double strike_price;
        double reservation_price;
    };

    struct ScenarioCost
    {
        bool should_exercise;
        double exercised;
        double total_cost;
        double spot_only_cost;
    };

    // Options are exercised only when the spot market is dearer than the strike.
    ScenarioCost scenario_cost(const OptionPosition &position, double spot_price, double demand)
    {
        const bool should_exercise = spot_price > position.strike_price;
        const double exercised = should_exercise ? std::min(demand, position.option_quantity) : 0.0;
        const double remaining = std::max(demand - exercised, 0.0);
        const double total_cost = position.option_quantity * position.reservation_price +
                                  exercised * position.strike_price + remaining * spot_price;
        return ScenarioCost{should_exercise, exercised, total_cost, demand * spot_price};
    }

    // Same rule under a demand distribution: exercised units are E[min(optionQty, D)].
    ScenarioCost expected_scenario_cost(const OptionPosition &position, double spot_price, const RandomDemand &demand)
    {
        const bool should_exercise = spot_price > position.strike_price;
        const double exercised = should_exercise ? expected_sales(position.option_quantity, demand.distribution) : 0.0;
        const double remaining = std::max(demand.expected_demand - exercised, 0.0);
        const double total_cost = position.option_quantity * position.reservation_price +
                                  exercised * position.strike_price + remaining * spot_price;
        return ScenarioCost{should_exercise, exercised, total_cost, demand.expected_demand * spot_price};
    }

    ScenarioCost cost_at_spot(const OptionPosition &position, double spot_price, const ParsedDemandContext &context)
    {
        if (const auto *random = std::get_if<RandomDemand>(&context))
        {
            return expected_scenario_cost(position, spot_price, *random);
        }
        return scenario_cost(position, spot_price, std::get<DeterministicDemand>(context).demand);
    }

    struct OptimizationTerms
    {
        double reservation_price;
        double exercise_price;
        double spot_price;
        double mean_demand;
        double std_dev_demand;
    };

    struct ExpectedStrategyCost
    {
        double expected_exercised;
        double expected_spot_purchase;
        double total_cost;
    };

    ExpectedStrategyCost expected_option_strategy_cost(const OptimizationTerms &terms, double option_quantity)
    {
        const ParsedDistribution demand = NormalDistribution{terms.mean_demand, terms.std_dev_demand};
        const double expected_exercised = expected_sales(option_quantity, demand);
        const double expected_spot_purchase = std::max(terms.mean_demand - expected_exercised, 0.0);
        const double total_cost = option_quantity * terms.reservation_price +
                                  expected_exercised * terms.exercise_price +
                                  expected_spot_purchase * terms.spot_price;
        return ExpectedStrategyCost{expected_exercised, expected_spot_purchase, total_cost};
    }

    std::vector<SeriesConfig> strategy_series()
    {
        return {{"optionStrategy", "Option Strategy Cost", line_colors::Teal},
                {"spotOnly", "Spot-Only Cost", line_colors::Blue}};
    }
}

CalculationResult OptionContractEvaluator::evaluate(const ParsedCalculationPayload &payload) const
{
    if (payload.option_evaluation_mode == OptionEvaluationMode::Optimization)
    {
        return evaluate_optimization(payload);
    }
    return evaluate_standard(payload);
}

CalculationResult OptionContractEvaluator::evaluate_standard(const ParsedCalculationPayload &payload) const
{
    const OptionPosition position{
        payload.input("optionQuantity"),
        payload.input("strikePrice"),
        payload.input("reservationPrice")};
    const double spot_price = payload.input("spotPrice");
    const double reference_demand = demand_reference(payload.demand_context);

    const ScenarioCost current = cost_at_spot(position, spot_price, payload.demand_context);
    const double cost_savings = current.spot_only_cost - current.total_cost;
    const double break_even_spot_price = position.strike_price + position.reservation_price;

    CalculationResult result;
    if (!current.should_exercise)
    {
        result.key_decision = "Do not exercise options; buying from spot market is cheaper than strike execution.";
    }
    else if (cost_savings >= 0)
    {
        result.key_decision = "Exercise options under current spot market conditions.";
    }
    else
    {
        result.key_decision = "Model indicates exercise by rule (Spot > Strike), but premium burden reduces savings.";
    }

    const double spot_start = std::max(0.0, std::min(spot_price * 0.4, position.strike_price * 0.4));
    const double spot_end = std::max({spot_price * 1.8, position.strike_price * 2.0, 20.0});

    ChartConfig cost_vs_spot = make_line_chart(
        "Cost vs Spot Price", "Option strategy versus pure spot purchasing", "spotPrice", "Spot Price", "Total Cost",
        strategy_series());
    for (double spot : create_range(spot_start, spot_end, kSensitivityPoints))
    {
        const ScenarioCost point = cost_at_spot(position, spot, payload.demand_context);
        add_point(cost_vs_spot, spot, {point.total_cost, point.spot_only_cost});
    }

    ChartConfig cost_vs_demand = make_line_chart(
        "Cost vs Demand", "Demand sensitivity at current spot price", "demand", "Demand", "Total Cost",
        strategy_series());
    for (double demand : sensitivity_range(std::max(reference_demand, position.option_quantity)))
    {
        const ScenarioCost point = scenario_cost(position, spot_price, demand);
        add_point(cost_vs_demand, demand, {point.total_cost, point.spot_only_cost});
    }

    result.charts = {std::move(cost_vs_spot), std::move(cost_vs_demand)};

    result.metrics = {
        text_metric("Should Exercise?", current.should_exercise ? "YES" : "NO",
                    current.should_exercise ? MetricTone::Positive : MetricTone::Info, true),
        numeric_metric(demand_aware_label(payload, "Quantity Exercised"), current.exercised),
        numeric_metric(demand_aware_label(payload, "Total Cost"), current.total_cost, MetricTone::Negative),
        numeric_metric(demand_aware_label(payload, "Spot-Only Cost"), current.spot_only_cost),
        numeric_metric("Cost Savings vs Spot", cost_savings, sign_tone(cost_savings)),
        numeric_metric("Break-Even Spot Price", break_even_spot_price, MetricTone::Info)};

    result.notes = {"Break-even spot price is strike plus reservation price."};
    return result;
}

CalculationResult OptionContractEvaluator::evaluate_optimization(const ParsedCalculationPayload &payload) const
{
    const OptimizationTerms terms{
        payload.input("reservationPrice"),
        payload.input("exercisePrice"),
        payload.input("spotPrice"),
        payload.input("meanDemand"),
        payload.input("stdDevDemand")};
    const double long_term_contract_price = payload.input("longTermContractPrice");

    // Newsvendor on the option quantity: Cu = spot - exercise, Co = reservation.
    const double cost_understocking = terms.spot_price - terms.exercise_price;
    const double cost_overstocking = terms.reservation_price;
    const double raw_service_level = cost_understocking + cost_overstocking > 0
                                         ? cost_understocking / (cost_understocking + cost_overstocking)
                                         : 0.0;
    const double optimal_service_level = clamp_value(raw_service_level, 0.0, 1.0);
    const double z_score = inverse_normal_cdf(optimal_service_level);
    const double optimal_option_quantity = std::max(0.0, terms.mean_demand + z_score * terms.std_dev_demand);

    const double option_strategy_cost = expected_option_strategy_cost(terms, optimal_option_quantity).total_cost;
    const double long_term_contract_cost = terms.mean_demand * long_term_contract_price;
    const double cost_difference = long_term_contract_cost - option_strategy_cost;
    const bool prefer_options = option_strategy_cost < long_term_contract_cost;
    const std::string recommended_strategy = prefer_options ? "Use Option Contract" : "Use Long-Term Contract";

    CalculationResult result;
    result.key_decision = prefer_options
                              ? "Optimization favors options as the lower expected-cost strategy."
                              : "Optimization favors long-term contracting under current parameters.";
    result.metrics_section_title = "Optimization Results";

    ChartConfig cost_curve = make_line_chart(
        "Expected Cost vs Option Quantity", "Newsvendor optimization cost curve", "optionQuantity", "Option Quantity",
        "Expected Cost", {{"expectedCost", "Expected Cost", line_colors::Teal}});
    for (double quantity : sensitivity_range(std::max(optimal_option_quantity, terms.mean_demand)))
    {
        add_point(cost_curve, quantity, {expected_option_strategy_cost(terms, quantity).total_cost});
    }
    cost_curve.reference_x = ReferenceLine{round_to_cents(optimal_option_quantity), "Optimal Q*", line_colors::Amber};

    ChartConfig comparison = make_bar_chart(
        "Cost Comparison Bar Chart", "Option strategy versus long-term contracting", "category", "Comparison",
        "Expected Cost",
        {{"optionStrategy", "Option Strategy Cost", line_colors::Teal},
         {"longTermContract", "Long-Term Contract Cost", line_colors::Blue}});
    add_category(comparison, "Expected Cost", {option_strategy_cost, long_term_contract_cost});

    result.charts = {std::move(cost_curve), std::move(comparison)};

    result.metrics = {
        numeric_metric("Cost of Understocking (Cu)", cost_understocking,
                       cost_understocking > 0 ? MetricTone::Info : MetricTone::Negative),
        numeric_metric("Cost of Overstocking (Co)", cost_overstocking, MetricTone::Info),
        numeric_metric("Optimal Service Level", optimal_service_level * 100.0, MetricTone::Info),
        numeric_metric("Z-score", z_score, MetricTone::Info),
        numeric_metric("Optimal Option Quantity (Q*)", optimal_option_quantity, MetricTone::Positive, true),
        numeric_metric("Expected Cost (Option Strategy)", option_strategy_cost, MetricTone::Negative),
        numeric_metric("Expected Cost (Long-Term Contract)", long_term_contract_cost, MetricTone::Negative),
        numeric_metric("Cost Difference (Long-Term - Option)", cost_difference, sign_tone(cost_difference)),
        text_metric("Recommended Strategy", recommended_strategy,
                    prefer_options ? MetricTone::Positive : MetricTone::Info, true)};

    if (cost_understocking <= 0)
    {
        result.warnings = {"Option contract has no understock advantage."};
    }

    result.notes = {
        "Optimization assumes normally distributed demand and computes expected exercised units with E[min(Q*, D)]."};
    return result;
}
