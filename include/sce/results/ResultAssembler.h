#pragma once

#include "include/sce/core/datastructures.h"
#include <string>
#include <vector>

constexpr int kSensitivityPoints = 32;

// Series palette handed to the rendering layer.
namespace line_colors
{
    constexpr const char *Teal = "#14b8a6";
    constexpr const char *Blue = "#38bdf8";
    constexpr const char *Cyan = "#22d3ee";
    constexpr const char *Amber = "#f59e0b";
}

// Display rounding: two decimal places.
double round_to_cents(double value);

// points evenly spaced values from start to end inclusive; a single value when degenerate.
std::vector<double> create_range(double start, double end, int points);

// Sample grid over [0, max(2 * anchor, 40)].
std::vector<double> sensitivity_range(double anchor);

MetricTone sign_tone(double value);

// "Expected <label>" under random demand, the bare label otherwise.
std::string demand_aware_label(const ParsedCalculationPayload &payload, const std::string &label);

MetricCard numeric_metric(const std::string &label, double value,
                          MetricTone tone = MetricTone::Neutral, bool emphasize = false);
MetricCard text_metric(const std::string &label, const std::string &value,
                       MetricTone tone = MetricTone::Neutral, bool emphasize = false);

ChartConfig make_line_chart(const std::string &title, const std::string &subtitle,
                            const std::string &x_key, const std::string &x_label, const std::string &y_label,
                            std::vector<SeriesConfig> lines);
ChartConfig make_bar_chart(const std::string &title, const std::string &subtitle,
                           const std::string &x_key, const std::string &x_label, const std::string &y_label,
                           std::vector<SeriesConfig> bars);

// Appends one sample row; values follow the chart's series order. All numbers are rounded.
void add_point(ChartConfig &chart, double x, const std::vector<double> &values);
void add_category(ChartConfig &chart, const std::string &category, const std::vector<double> &values);
