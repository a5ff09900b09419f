#include "include/sce/evaluators/order_stats.h"
#include "include/sce/distributions/demand_math.h"
#include <algorithm>

OrderStats deterministic_order_stats(double order_quantity, double demand)
{
    const double q = std::max(0.0, order_quantity);
    const double d = std::max(0.0, demand);
    const double sales = std::min(q, d);
    const double level = d > 0 ? sales / d : 1.0;

    return OrderStats{
        sales,
        std::max(q - d, 0.0),
        std::max(d - q, 0.0),
        clamp_value(level, 0.0, 1.0),
        d};
}

OrderStats order_stats(double order_quantity, const ParsedDemandContext &context)
{
    if (const auto *deterministic = std::get_if<DeterministicDemand>(&context))
    {
        return deterministic_order_stats(order_quantity, deterministic->demand);
    }

    const auto &random = std::get<RandomDemand>(context);
    const double q = std::max(0.0, order_quantity);
    const double sales = expected_sales(q, random.distribution);

    return OrderStats{
        sales,
        std::max(q - sales, 0.0),
        std::max(random.expected_demand - sales, 0.0),
        service_level(q, random.distribution),
        random.expected_demand};
}

double demand_reference(const ParsedDemandContext &context)
{
    if (const auto *deterministic = std::get_if<DeterministicDemand>(&context))
    {
        return deterministic->demand;
    }
    return std::get<RandomDemand>(context).expected_demand;
}

double apply_mismatch_profit_adjustments(double base_profit, double leftover, double unmet, const ResolvedCosts &costs)
{
    double adjusted = base_profit;
    adjusted -= costs.holding_cost * leftover;
    adjusted -= costs.shortage_cost * unmet;
    adjusted -= costs.penalty_cost * unmet;
    return adjusted;
}

double apply_mismatch_cost_adjustments(double base_cost, double overstock, double understock, const ResolvedCosts &costs)
{
    double adjusted = base_cost;
    adjusted += costs.holding_cost * overstock;
    adjusted += costs.shortage_cost * understock;
    adjusted += costs.penalty_cost * understock;
    adjusted -= costs.salvage_value * overstock;
    return adjusted;
}
