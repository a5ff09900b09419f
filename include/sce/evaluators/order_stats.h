#pragma once

#include "include/sce/core/datastructures.h"

struct OrderStats
{
    double sales;
    double leftover;
    double unmet;
    double service_level;
    double demand_reference;
};

// Exact arithmetic for a known demand; service level is the filled fraction of demand.
OrderStats deterministic_order_stats(double order_quantity, double demand);

// Expected values under the demand context.
OrderStats order_stats(double order_quantity, const ParsedDemandContext &context);

// Realized demand for deterministic contexts, expected demand for random ones.
double demand_reference(const ParsedDemandContext &context);

// Subtracts holding, shortage and penalty charges from a profit figure.
double apply_mismatch_profit_adjustments(double base_profit, double leftover, double unmet, const ResolvedCosts &costs);

// Adds holding, shortage and penalty charges to a cost figure and credits salvage on overstock.
double apply_mismatch_cost_adjustments(double base_cost, double overstock, double understock, const ResolvedCosts &costs);
