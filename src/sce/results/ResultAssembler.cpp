#include "include/sce/results/ResultAssembler.h"
#include <algorithm>
#include <cmath>

namespace
{
    ChartConfig make_chart(ChartType type, const std::string &title, const std::string &subtitle,
                           const std::string &x_key, const std::string &x_label, const std::string &y_label,
                           const std::vector<SeriesConfig> &series)
    {
        ChartConfig chart;
        chart.title = title;
        chart.subtitle = subtitle;
        chart.chart_type = type;
        chart.x_key = x_key;
        chart.x_label = x_label;
        chart.y_label = y_label;
        chart.columns.push_back(x_key);
        for (const auto &entry : series)
        {
            chart.columns.push_back(entry.data_key);
        }
        return chart;
    }

    std::vector<ChartCell> rounded_cells(const std::vector<double> &values)
    {
        std::vector<ChartCell> cells;
        cells.reserve(values.size() + 1);
        for (double value : values)
        {
            cells.emplace_back(round_to_cents(value));
        }
        return cells;
    }
}

double round_to_cents(double value)
{
    return std::round(value * 100.0) / 100.0;
}

std::vector<double> create_range(double start, double end, int points)
{
    if (points <= 1 || start == end)
    {
        return {start};
    }

    const double step = (end - start) / (points - 1);
    std::vector<double> range(points);
    for (int i = 0; i < points; ++i)
    {
        range[i] = start + i * step;
    }
    return range;
}

std::vector<double> sensitivity_range(double anchor)
{
    return create_range(0.0, std::max(anchor * 2.0, 40.0), kSensitivityPoints);
}

MetricTone sign_tone(double value)
{
    return value >= 0 ? MetricTone::Positive : MetricTone::Negative;
}

std::string demand_aware_label(const ParsedCalculationPayload &payload, const std::string &label)
{
    return payload.is_random_demand() ? "Expected " + label : label;
}

MetricCard numeric_metric(const std::string &label, double value, MetricTone tone, bool emphasize)
{
    return MetricCard{label, round_to_cents(value), emphasize, tone};
}

MetricCard text_metric(const std::string &label, const std::string &value, MetricTone tone, bool emphasize)
{
    return MetricCard{label, value, emphasize, tone};
}

ChartConfig make_line_chart(const std::string &title, const std::string &subtitle,
                            const std::string &x_key, const std::string &x_label, const std::string &y_label,
                            std::vector<SeriesConfig> lines)
{
    ChartConfig chart = make_chart(ChartType::Line, title, subtitle, x_key, x_label, y_label, lines);
    chart.lines = std::move(lines);
    return chart;
}

ChartConfig make_bar_chart(const std::string &title, const std::string &subtitle,
                           const std::string &x_key, const std::string &x_label, const std::string &y_label,
                           std::vector<SeriesConfig> bars)
{
    ChartConfig chart = make_chart(ChartType::Bar, title, subtitle, x_key, x_label, y_label, bars);
    chart.bars = std::move(bars);
    return chart;
}

void add_point(ChartConfig &chart, double x, const std::vector<double> &values)
{
    std::vector<ChartCell> row;
    row.reserve(values.size() + 1);
    row.emplace_back(round_to_cents(x));
    for (auto &cell : rounded_cells(values))
    {
        row.push_back(std::move(cell));
    }
    chart.rows.push_back(std::move(row));
}

void add_category(ChartConfig &chart, const std::string &category, const std::vector<double> &values)
{
    std::vector<ChartCell> row;
    row.reserve(values.size() + 1);
    row.emplace_back(category);
    for (auto &cell : rounded_cells(values))
    {
        row.push_back(std::move(cell));
    }
    chart.rows.push_back(std::move(row));
}
