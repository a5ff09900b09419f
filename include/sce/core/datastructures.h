#pragma once

#include "include/sce/distributions/Distributions.h"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class ContractType
{
    Wholesale,
    Buyback,
    RevenueSharing,
    OptionContract,
    QuantityFlexibility
};

enum class OptionEvaluationMode
{
    Standard,
    Optimization
};

enum class DemandType
{
    Deterministic,
    Random
};

enum class DistributionType
{
    Normal,
    Uniform,
    Discrete
};

// --- Raw (textual) payload ---

struct DemandSettings
{
    DemandType demand_type = DemandType::Deterministic;
    DistributionType distribution_type = DistributionType::Normal;
    std::string demand;
    std::string mean;
    std::string std_dev;
    std::string lower_bound;
    std::string upper_bound;
    std::string discrete_values;
    std::string discrete_probabilities;
};

struct AdvancedCostToggles
{
    bool include_salvage = false;
    bool include_holding = false;
    bool include_shortage = false;
    bool include_penalty = false;
};

struct CostInputs
{
    std::string salvage_value;
    std::string holding_cost;
    std::string shortage_cost;
    std::string penalty_cost;
};

struct CalculationPayload
{
    ContractType contract_type = ContractType::Wholesale;
    OptionEvaluationMode option_evaluation_mode = OptionEvaluationMode::Standard;
    std::map<std::string, std::string> inputs;
    DemandSettings demand_settings;
    AdvancedCostToggles toggles;
    CostInputs cost_inputs;
};

// --- Validated payload ---

struct ResolvedCosts
{
    double salvage_value = 0.0;
    double holding_cost = 0.0;
    double shortage_cost = 0.0;
    double penalty_cost = 0.0;
};

struct ParsedCalculationPayload
{
    ContractType contract_type;
    OptionEvaluationMode option_evaluation_mode;
    std::map<std::string, double> inputs;
    ParsedDemandContext demand_context;
    AdvancedCostToggles toggles;
    ResolvedCosts costs;

    double input(const std::string &key) const { return inputs.at(key); }
    bool is_random_demand() const { return std::holds_alternative<RandomDemand>(demand_context); }
};

// --- Result ---

enum class MetricTone
{
    Neutral,
    Positive,
    Negative,
    Info
};

using MetricValue = std::variant<double, std::string>;

struct MetricCard
{
    std::string label;
    MetricValue value;
    bool emphasize = false;
    MetricTone tone = MetricTone::Neutral;
};

enum class ChartType
{
    Line,
    Bar
};

struct SeriesConfig
{
    std::string data_key;
    std::string name;
    std::string color;
};

struct ReferenceLine
{
    double value;
    std::string label;
    std::string color;
};

using ChartCell = std::variant<double, std::string>;

// Tabular sample data: columns[0] is always x_key, the remaining columns are series keys.
struct ChartConfig
{
    std::string title;
    std::string subtitle;
    ChartType chart_type = ChartType::Line;
    std::string x_key;
    std::string x_label;
    std::string y_label;
    std::vector<std::string> columns;
    std::vector<std::vector<ChartCell>> rows;
    std::vector<SeriesConfig> lines;
    std::vector<SeriesConfig> bars;
    std::optional<ReferenceLine> reference_x;
};

struct CalculationResult
{
    std::string key_decision;
    std::vector<MetricCard> metrics;
    std::optional<std::string> metrics_section_title;
    std::vector<ChartConfig> charts;
    std::vector<std::string> warnings;
    std::vector<std::string> notes;
};

struct CalculationResponse
{
    std::optional<CalculationResult> result;
    std::vector<std::string> errors;
};
