#pragma once

#include "include/sce/distributions/Distributions.h"
#include <utility>
#include <vector>

// Tolerance used for degenerate uniform bands, inverse-CDF clamping and discrete quantiles.
constexpr double kDemandEpsilon = 1e-9;

// Midpoint-rule subintervals for the normal expected-sales integral.
constexpr int kNormalSalesIntegrationSteps = 1400;

double clamp_value(double value, double min, double max);

// --- Normal distribution primitives ---

// Abramowitz-Stegun 7.1.26, absolute error below 1.5e-7.
double erf_approx(double x);
double normal_pdf(double x, double mean, double std_dev);
double normal_cdf(double x, double mean, double std_dev);

// Acklam's rational approximation; p is clamped to [1e-9, 1 - 1e-9].
double inverse_standard_normal_cdf(double p);
double inverse_normal_cdf(double p, double mean = 0.0, double std_dev = 1.0);

// E[min(Q, D)] for D ~ N(mean, std_dev) with negative demand contributing no sales.
double estimate_expected_sales_normal(double order_quantity, double mean, double std_dev,
                                      int steps = kNormalSalesIntegrationSteps);

// --- Distribution-generic operations ---

double expected_demand(const ParsedDistribution &distribution);
double expected_sales(double order_quantity, const ParsedDistribution &distribution);
double service_level(double order_quantity, const ParsedDistribution &distribution);
double quantile_for_distribution(double probability, const ParsedDistribution &distribution);

// (value, probability) pairs ordered by value.
std::vector<std::pair<double, double>> sorted_support(const DiscreteDistribution &distribution);
