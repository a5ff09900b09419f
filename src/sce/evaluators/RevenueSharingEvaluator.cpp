#include "include/sce/evaluators/RevenueSharingEvaluator.h"
#include "include/sce/evaluators/evaluators_registration.h"
#include "include/sce/evaluators/order_stats.h"
#include "include/sce/results/ResultAssembler.h"
#include <algorithm>

void register_revenue_sharing_evaluator(EvaluatorRegistry &registry)
{
    registry.register_evaluator(ContractType::RevenueSharing, []
                                { return std::make_unique<RevenueSharingEvaluator>(); });
}

namespace
{
    struct SharingTerms
    {
        double retail_price;
        double wholesale_price;
        double alpha;
    };

    struct SharingSplit
    {
        double retailer;
        double supplier;
        double total() const { return retailer + supplier; }
    };

    SharingSplit sharing_split(const SharingTerms &terms, double order_quantity, const OrderStats &stats,
                               const ResolvedCosts &costs)
    {
        const double revenue = terms.retail_price * stats.sales;
        const double retailer = apply_mismatch_profit_adjustments(
            (1.0 - terms.alpha) * revenue - terms.wholesale_price * order_quantity,
            stats.leftover, stats.unmet, costs);
        const double supplier = terms.alpha * revenue + terms.wholesale_price * order_quantity;
        return SharingSplit{retailer, supplier};
    }

    std::string coordination_indicator(double alpha, double service_level)
    {
        if (alpha >= 0.2 && alpha <= 0.45 && service_level >= 0.85)
        {
            return "Strong";
        }
        if (alpha >= 0.1 && alpha <= 0.6)
        {
            return "Moderate";
        }
        return "Weak";
    }

    std::vector<SeriesConfig> role_series()
    {
        return {{"retailer", "Retailer", line_colors::Teal},
                {"supplier", "Supplier", line_colors::Blue},
                {"total", "Total", line_colors::Cyan}};
    }
}

CalculationResult RevenueSharingEvaluator::evaluate(const ParsedCalculationPayload &payload) const
{
    const SharingTerms terms{
        payload.input("retailPrice"),
        payload.input("wholesalePrice"),
        payload.input("revenueShareRatio")};
    const double order_quantity = payload.input("orderQuantity");

    const OrderStats stats = order_stats(order_quantity, payload.demand_context);
    const SharingSplit split = sharing_split(terms, order_quantity, stats, payload.costs);
    const std::string indicator = coordination_indicator(terms.alpha, stats.service_level);

    CalculationResult result;
    if (indicator == "Strong")
    {
        result.key_decision = "Current revenue share terms produce balanced incentive alignment.";
    }
    else if (indicator == "Moderate")
    {
        result.key_decision = "Incentive alignment is moderate; tune alpha and quantity to improve coordination.";
    }
    else
    {
        result.key_decision = "Revenue split is poorly aligned for this demand profile.";
    }

    ChartConfig profit_vs_order = make_line_chart(
        "Profit vs Order Quantity", "Profit split under quantity changes", "quantity", "Order Quantity", "Profit",
        role_series());
    for (double quantity : sensitivity_range(std::max(order_quantity, stats.demand_reference)))
    {
        const SharingSplit point = sharing_split(terms, quantity, order_stats(quantity, payload.demand_context), payload.costs);
        add_point(profit_vs_order, quantity, {point.retailer, point.supplier, point.total()});
    }

    ChartConfig profit_vs_demand = make_line_chart(
        "Profit vs Demand", "Demand sensitivity at current quantity", "demand", "Demand", "Profit",
        role_series());
    for (double demand : sensitivity_range(std::max(stats.demand_reference, order_quantity)))
    {
        const SharingSplit point = sharing_split(terms, order_quantity, deterministic_order_stats(order_quantity, demand), payload.costs);
        add_point(profit_vs_demand, demand, {point.retailer, point.supplier, point.total()});
    }

    result.charts = {std::move(profit_vs_order), std::move(profit_vs_demand)};

    result.metrics = {
        numeric_metric(demand_aware_label(payload, "Retailer Profit"), split.retailer, sign_tone(split.retailer)),
        numeric_metric(demand_aware_label(payload, "Supplier Profit"), split.supplier, sign_tone(split.supplier)),
        numeric_metric("Total Supply Chain Profit", split.total(), sign_tone(split.total()), true),
        text_metric("Coordination Indicator", indicator, indicator == "Strong" ? MetricTone::Positive : MetricTone::Info)};

    result.notes = {"Revenue share ratio controls profit transfer between retailer and supplier."};
    return result;
}
