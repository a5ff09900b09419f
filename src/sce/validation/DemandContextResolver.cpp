#include "include/sce/validation/DemandContextResolver.h"
#include "include/sce/validation/number_parsing.h"
#include "include/sce/distributions/demand_math.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace
{
    bool is_non_negative_number(double value)
    {
        return std::isfinite(value) && value >= 0;
    }

    std::optional<ParsedDistribution> resolve_normal(const DemandSettings &settings, std::vector<std::string> &errors)
    {
        const auto mean = parse_number(settings.mean, "Mean demand", errors);
        const auto std_dev = parse_number(settings.std_dev, "Standard deviation", errors, true);
        if (!mean || !std_dev)
        {
            return std::nullopt;
        }
        return NormalDistribution{*mean, *std_dev};
    }

    std::optional<ParsedDistribution> resolve_uniform(const DemandSettings &settings, std::vector<std::string> &errors)
    {
        const auto lower = parse_number(settings.lower_bound, "Lower bound", errors);
        const auto upper = parse_number(settings.upper_bound, "Upper bound", errors);
        if (!lower || !upper)
        {
            return std::nullopt;
        }
        if (*upper <= *lower)
        {
            errors.push_back("Upper bound must be greater than lower bound for uniform demand.");
            return std::nullopt;
        }
        return UniformDistribution{*lower, *upper};
    }
}

std::optional<DiscreteDistribution> validate_discrete_distribution(const std::string &values_raw,
                                                                   const std::string &probabilities_raw,
                                                                   std::vector<std::string> &errors)
{
    std::vector<double> values = parse_number_array(values_raw);
    std::vector<double> probabilities = parse_number_array(probabilities_raw);

    if (values.empty() || probabilities.empty())
    {
        errors.push_back("Discrete demand values and probabilities cannot be empty.");
        return std::nullopt;
    }

    if (values.size() != probabilities.size())
    {
        errors.push_back("Discrete demand values and probabilities must have the same length.");
        return std::nullopt;
    }

    if (!std::all_of(values.begin(), values.end(), is_non_negative_number))
    {
        errors.push_back("Discrete demand values must be non-negative numbers.");
        return std::nullopt;
    }

    if (!std::all_of(probabilities.begin(), probabilities.end(), is_non_negative_number))
    {
        errors.push_back("Discrete probabilities must be non-negative numbers.");
        return std::nullopt;
    }

    // The extra 1e-12 keeps sums such as 0.5 + 0.499 inside the band despite rounding.
    const double sum = std::accumulate(probabilities.begin(), probabilities.end(), 0.0);
    if (std::abs(sum - 1.0) > kProbabilitySumTolerance + 1e-12)
    {
        errors.push_back("Discrete probabilities must sum to 1.");
        return std::nullopt;
    }

    return DiscreteDistribution{std::move(values), std::move(probabilities)};
}

std::optional<ParsedDemandContext> resolve_demand_context(const DemandSettings &settings,
                                                          std::vector<std::string> &errors)
{
    if (settings.demand_type == DemandType::Deterministic)
    {
        const auto demand = parse_number(settings.demand, "Demand", errors);
        if (!demand)
        {
            return std::nullopt;
        }
        return DeterministicDemand{*demand};
    }

    std::optional<ParsedDistribution> distribution;
    switch (settings.distribution_type)
    {
    case DistributionType::Normal:
        distribution = resolve_normal(settings, errors);
        break;
    case DistributionType::Uniform:
        distribution = resolve_uniform(settings, errors);
        break;
    case DistributionType::Discrete:
        if (auto discrete = validate_discrete_distribution(settings.discrete_values,
                                                           settings.discrete_probabilities, errors))
        {
            distribution = std::move(*discrete);
        }
        break;
    }

    if (!distribution)
    {
        return std::nullopt;
    }

    const double mean_demand = expected_demand(*distribution);
    return RandomDemand{std::move(*distribution), mean_demand};
}
