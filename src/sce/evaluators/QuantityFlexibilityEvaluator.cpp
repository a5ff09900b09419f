#include "include/sce/evaluators/QuantityFlexibilityEvaluator.h"
#include "include/sce/evaluators/evaluators_registration.h"
#include "include/sce/evaluators/order_stats.h"
#include "include/sce/results/ResultAssembler.h"
#include "include/sce/distributions/demand_math.h"
#include <algorithm>

void register_quantity_flexibility_evaluator(EvaluatorRegistry &registry)
{
    registry.register_evaluator(ContractType::QuantityFlexibility, []
                                { return std::make_unique<QuantityFlexibilityEvaluator>(); });
}

namespace
{
    struct FlexibleOrder
    {
        double final_order;
        double overstock;
        double understock;
        double total_cost;
    };

    // The final order tracks demand but may not leave [c(1 - r%), c(1 + r%)].
    FlexibleOrder flexible_order(double commitment, double adjustment_range, double wholesale_price, double demand,
                                 const ResolvedCosts &costs)
    {
        const double lower = commitment * (1.0 - adjustment_range / 100.0);
        const double upper = commitment * (1.0 + adjustment_range / 100.0);
        const double final_order = clamp_value(demand, lower, upper);
        const double overstock = std::max(final_order - demand, 0.0);
        const double understock = std::max(demand - final_order, 0.0);
        const double total_cost = apply_mismatch_cost_adjustments(final_order * wholesale_price, overstock, understock, costs);
        return FlexibleOrder{final_order, overstock, understock, total_cost};
    }
}

CalculationResult QuantityFlexibilityEvaluator::evaluate(const ParsedCalculationPayload &payload) const
{
    const double initial_commitment = payload.input("initialCommitment");
    const double adjustment_range = payload.input("adjustmentRange");
    const double wholesale_price = payload.input("wholesalePrice");
    const double reference_demand = demand_reference(payload.demand_context);

    const FlexibleOrder order = flexible_order(initial_commitment, adjustment_range, wholesale_price,
                                               reference_demand, payload.costs);

    CalculationResult result;
    if (order.understock > order.overstock)
    {
        result.key_decision = "Increase baseline commitment or flexibility range to reduce understock risk.";
    }
    else if (order.overstock > order.understock)
    {
        result.key_decision = "Reduce baseline commitment to limit overstock carrying cost.";
    }
    else
    {
        result.key_decision = "Current commitment and flexibility band are well balanced.";
    }

    ChartConfig cost_vs_commitment = make_line_chart(
        "Cost vs Order Commitment", "Cost sensitivity to initial commitment", "commitment", "Initial Commitment",
        "Total Cost", {{"totalCost", "Total Cost", line_colors::Teal}});
    for (double commitment : sensitivity_range(std::max(initial_commitment, reference_demand)))
    {
        const FlexibleOrder point = flexible_order(commitment, adjustment_range, wholesale_price, reference_demand, payload.costs);
        add_point(cost_vs_commitment, commitment, {point.total_cost});
    }

    ChartConfig cost_vs_demand = make_line_chart(
        "Cost vs Demand", "Demand sensitivity under flexibility band", "demand", "Demand", "Total Cost",
        {{"totalCost", "Total Cost", line_colors::Blue}});
    for (double demand : sensitivity_range(std::max(reference_demand, initial_commitment)))
    {
        const FlexibleOrder point = flexible_order(initial_commitment, adjustment_range, wholesale_price, demand, payload.costs);
        add_point(cost_vs_demand, demand, {point.total_cost});
    }

    result.charts = {std::move(cost_vs_commitment), std::move(cost_vs_demand)};

    result.metrics = {
        numeric_metric("Final Order", order.final_order, MetricTone::Info, true),
        numeric_metric("Overstock", order.overstock, order.overstock > 0 ? MetricTone::Negative : MetricTone::Neutral),
        numeric_metric("Understock", order.understock, order.understock > 0 ? MetricTone::Negative : MetricTone::Neutral),
        numeric_metric(demand_aware_label(payload, "Total Cost"), order.total_cost, MetricTone::Negative)};

    result.notes = {
        "Final order is optimally adjusted toward demand while respecting the contract flexibility range."};
    return result;
}
