#include "include/sce/core/EnumNames.h"

std::string to_string(ContractType type)
{
    switch (type)
    {
    case ContractType::Wholesale:
        return "wholesale";
    case ContractType::Buyback:
        return "buyback";
    case ContractType::RevenueSharing:
        return "revenueSharing";
    case ContractType::OptionContract:
        return "optionContract";
    case ContractType::QuantityFlexibility:
        return "quantityFlexibility";
    }
    return "unknown";
}

std::string to_string(OptionEvaluationMode mode)
{
    switch (mode)
    {
    case OptionEvaluationMode::Standard:
        return "standard";
    case OptionEvaluationMode::Optimization:
        return "optimization";
    }
    return "unknown";
}

std::string to_string(DemandType type)
{
    switch (type)
    {
    case DemandType::Deterministic:
        return "deterministic";
    case DemandType::Random:
        return "random";
    }
    return "unknown";
}

std::string to_string(DistributionType type)
{
    switch (type)
    {
    case DistributionType::Normal:
        return "normal";
    case DistributionType::Uniform:
        return "uniform";
    case DistributionType::Discrete:
        return "discrete";
    }
    return "unknown";
}

std::string to_string(MetricTone tone)
{
    switch (tone)
    {
    case MetricTone::Neutral:
        return "neutral";
    case MetricTone::Positive:
        return "positive";
    case MetricTone::Negative:
        return "negative";
    case MetricTone::Info:
        return "info";
    }
    return "neutral";
}

std::string to_string(ChartType type)
{
    return type == ChartType::Bar ? "bar" : "line";
}

const std::vector<ContractType> &all_contract_types()
{
    static const std::vector<ContractType> types = {
        ContractType::Wholesale,
        ContractType::Buyback,
        ContractType::RevenueSharing,
        ContractType::OptionContract,
        ContractType::QuantityFlexibility};
    return types;
}

std::optional<ContractType> parse_contract_type(const std::string &name)
{
    for (ContractType type : all_contract_types())
    {
        if (to_string(type) == name)
        {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<OptionEvaluationMode> parse_option_evaluation_mode(const std::string &name)
{
    if (name == "standard")
        return OptionEvaluationMode::Standard;
    if (name == "optimization")
        return OptionEvaluationMode::Optimization;
    return std::nullopt;
}

std::optional<DemandType> parse_demand_type(const std::string &name)
{
    if (name == "deterministic")
        return DemandType::Deterministic;
    if (name == "random")
        return DemandType::Random;
    return std::nullopt;
}

std::optional<DistributionType> parse_distribution_type(const std::string &name)
{
    if (name == "normal")
        return DistributionType::Normal;
    if (name == "uniform")
        return DistributionType::Uniform;
    if (name == "discrete")
        return DistributionType::Discrete;
    return std::nullopt;
}
