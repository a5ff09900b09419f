#include "include/sce/evaluators/WholesaleEvaluator.h"
#include "include/sce/evaluators/evaluators_registration.h"
#include "include/sce/evaluators/order_stats.h"
#include "include/sce/results/ResultAssembler.h"
#include "include/sce/distributions/demand_math.h"
#include "include/sce/validation/number_parsing.h"
#include <algorithm>
#include <cmath>

void register_wholesale_evaluator(EvaluatorRegistry &registry)
{
    registry.register_evaluator(ContractType::Wholesale, []
                                { return std::make_unique<WholesaleEvaluator>(); });
}

namespace
{
    struct WholesaleTerms
    {
        double retail_price;
        double wholesale_price;
        double salvage;
    };

    double wholesale_profit(const WholesaleTerms &terms, double order_quantity, const OrderStats &stats,
                            const ResolvedCosts &costs)
    {
        const double base = terms.retail_price * stats.sales + terms.salvage * stats.leftover -
                            terms.wholesale_price * order_quantity;
        return apply_mismatch_profit_adjustments(base, stats.leftover, stats.unmet, costs);
    }
}

CalculationResult WholesaleEvaluator::evaluate(const ParsedCalculationPayload &payload) const
{
    const WholesaleTerms terms{
        payload.input("retailPrice"),
        payload.input("wholesalePrice"),
        payload.toggles.include_salvage ? payload.costs.salvage_value : 0.0};
    const double order_quantity = payload.input("orderQuantity");

    const OrderStats stats = order_stats(order_quantity, payload.demand_context);
    const double profit = wholesale_profit(terms, order_quantity, stats, payload.costs);

    // Newsvendor critical fractile (p - w) / (p - s).
    const double denominator = terms.retail_price - terms.salvage;
    const double raw_fractile = denominator > 0 ? (terms.retail_price - terms.wholesale_price) / denominator : 0.0;
    const double critical_fractile = clamp_value(raw_fractile, 0.0, 1.0);

    double optimal_q = 0.0;
    if (const auto *random = std::get_if<RandomDemand>(&payload.demand_context))
    {
        optimal_q = quantile_for_distribution(critical_fractile, random->distribution);
    }
    else
    {
        optimal_q = std::get<DeterministicDemand>(payload.demand_context).demand;
    }

    CalculationResult result;

    const double gap = order_quantity - optimal_q;
    if (std::abs(gap) <= 1)
    {
        result.key_decision = "Current order quantity is near the model-optimal level.";
    }
    else if (gap < 0)
    {
        result.key_decision = "Increase order quantity toward " + format_number(round_to_cents(optimal_q)) +
                              " units to improve service performance.";
    }
    else
    {
        result.key_decision = "Reduce order quantity toward " + format_number(round_to_cents(optimal_q)) +
                              " units to limit overstock risk.";
    }

    ChartConfig profit_vs_order = make_line_chart(
        "Profit vs Order Quantity", "Order quantity sensitivity", "quantity", "Order Quantity", "Profit",
        {{"profit", "Profit", line_colors::Teal}});
    for (double quantity : sensitivity_range(std::max({order_quantity, optimal_q, stats.demand_reference})))
    {
        const OrderStats point = order_stats(quantity, payload.demand_context);
        add_point(profit_vs_order, quantity, {wholesale_profit(terms, quantity, point, payload.costs)});
    }

    ChartConfig profit_vs_demand = make_line_chart(
        "Profit vs Demand", "Demand sensitivity at current order quantity", "demand", "Demand", "Profit",
        {{"profit", "Profit", line_colors::Blue}});
    for (double demand : sensitivity_range(std::max(stats.demand_reference, order_quantity)))
    {
        const OrderStats point = deterministic_order_stats(order_quantity, demand);
        add_point(profit_vs_demand, demand, {wholesale_profit(terms, order_quantity, point, payload.costs)});
    }

    result.charts = {std::move(profit_vs_order), std::move(profit_vs_demand)};

    result.metrics = {
        numeric_metric(demand_aware_label(payload, "Profit"), profit, sign_tone(profit), true),
        numeric_metric("Service Level", stats.service_level * 100.0, MetricTone::Info),
        numeric_metric("Leftover Inventory", stats.leftover),
        numeric_metric("Optimal Q", optimal_q, MetricTone::Info),
        numeric_metric("Critical Fractile", critical_fractile)};

    if (payload.is_random_demand())
    {
        result.notes = {
            "Service level is the probability demand is fully satisfied.",
            "Optimal Q is computed from the critical fractile and selected demand distribution."};
    }
    else
    {
        result.notes = {"Service level is fulfilled demand divided by realized demand."};
    }

    return result;
}
