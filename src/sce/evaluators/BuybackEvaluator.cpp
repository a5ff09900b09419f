#include "include/sce/evaluators/BuybackEvaluator.h"
#include "include/sce/evaluators/evaluators_registration.h"
#include "include/sce/evaluators/order_stats.h"
#include "include/sce/results/ResultAssembler.h"
#include <algorithm>

void register_buyback_evaluator(EvaluatorRegistry &registry)
{
    registry.register_evaluator(ContractType::Buyback, []
                                { return std::make_unique<BuybackEvaluator>(); });
}

namespace
{
    struct BuybackTerms
    {
        double retail_price;
        double wholesale_price;
        double buyback_price;
    };

    struct BuybackSplit
    {
        double retailer;
        double manufacturer;
        double total() const { return retailer + manufacturer; }
    };

    BuybackSplit buyback_split(const BuybackTerms &terms, double order_quantity, const OrderStats &stats,
                               const ResolvedCosts &costs)
    {
        const double retailer = apply_mismatch_profit_adjustments(
            terms.retail_price * stats.sales + terms.buyback_price * stats.leftover - terms.wholesale_price * order_quantity,
            stats.leftover, stats.unmet, costs);
        const double manufacturer = terms.wholesale_price * order_quantity - terms.buyback_price * stats.leftover;
        return BuybackSplit{retailer, manufacturer};
    }

    std::string coordination_indicator(double buyback_ratio, double service_level)
    {
        if (buyback_ratio >= 0.3 && buyback_ratio <= 0.8 && service_level >= 0.85)
        {
            return "Strong";
        }
        if (buyback_ratio >= 0.2 && service_level >= 0.7)
        {
            return "Moderate";
        }
        return "Weak";
    }

    std::vector<SeriesConfig> role_series()
    {
        return {{"retailer", "Retailer", line_colors::Teal},
                {"manufacturer", "Manufacturer", line_colors::Blue},
                {"total", "Total", line_colors::Cyan}};
    }
}

CalculationResult BuybackEvaluator::evaluate(const ParsedCalculationPayload &payload) const
{
    const BuybackTerms terms{
        payload.input("retailPrice"),
        payload.input("wholesalePrice"),
        payload.input("buybackPrice")};
    const double order_quantity = payload.input("orderQuantity");

    const OrderStats stats = order_stats(order_quantity, payload.demand_context);
    const BuybackSplit split = buyback_split(terms, order_quantity, stats, payload.costs);

    const double buyback_ratio = terms.wholesale_price > 0 ? terms.buyback_price / terms.wholesale_price : 0.0;
    const std::string indicator = coordination_indicator(buyback_ratio, stats.service_level);

    CalculationResult result;
    if (indicator == "Strong")
    {
        result.key_decision = "Current buyback terms create strong coordination incentives.";
    }
    else if (indicator == "Moderate")
    {
        result.key_decision = "Contract partially aligns incentives; tune buyback price for tighter coordination.";
    }
    else
    {
        result.key_decision = "Coordination is weak; revise buyback terms or order quantity.";
    }

    ChartConfig profit_vs_order = make_line_chart(
        "Profit vs Order Quantity", "Role-level impact of order decision", "quantity", "Order Quantity", "Profit",
        role_series());
    for (double quantity : sensitivity_range(std::max(order_quantity, stats.demand_reference)))
    {
        const BuybackSplit point = buyback_split(terms, quantity, order_stats(quantity, payload.demand_context), payload.costs);
        add_point(profit_vs_order, quantity, {point.retailer, point.manufacturer, point.total()});
    }

    ChartConfig profit_vs_demand = make_line_chart(
        "Profit vs Demand", "Demand sensitivity at current order quantity", "demand", "Demand", "Profit",
        role_series());
    for (double demand : sensitivity_range(std::max(stats.demand_reference, order_quantity)))
    {
        const BuybackSplit point = buyback_split(terms, order_quantity, deterministic_order_stats(order_quantity, demand), payload.costs);
        add_point(profit_vs_demand, demand, {point.retailer, point.manufacturer, point.total()});
    }

    result.charts = {std::move(profit_vs_order), std::move(profit_vs_demand)};

    result.metrics = {
        numeric_metric(demand_aware_label(payload, "Retailer Profit"), split.retailer, sign_tone(split.retailer)),
        numeric_metric(demand_aware_label(payload, "Manufacturer Profit"), split.manufacturer, sign_tone(split.manufacturer)),
        numeric_metric("Total Profit", split.total(), sign_tone(split.total()), true),
        text_metric("Coordination Indicator", indicator, indicator == "Strong" ? MetricTone::Positive : MetricTone::Info)};

    result.notes = {"Coordination indicator reflects buyback ratio and achieved service level."};
    return result;
}
