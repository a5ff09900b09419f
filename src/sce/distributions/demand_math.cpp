#include "include/sce/distributions/demand_math.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <type_traits>
#include <variant>

namespace
{
    constexpr double kPi = 3.14159265358979323846;

    // Acklam coefficients.
    constexpr std::array<double, 6> kA = {
        -3.969683028665376e1, 2.209460984245205e2, -2.759285104469687e2,
        1.38357751867269e2, -3.066479806614716e1, 2.506628277459239};
    constexpr std::array<double, 5> kB = {
        -5.447609879822406e1, 1.615858368580409e2, -1.556989798598866e2,
        6.680131188771972e1, -1.328068155288572e1};
    constexpr std::array<double, 6> kC = {
        -7.784894002430293e-3, -3.223964580411365e-1, -2.400758277161838,
        -2.549732539343734, 4.374664141464968, 2.938163982698783};
    constexpr std::array<double, 4> kD = {
        7.784695709041462e-3, 3.224671290700398e-1, 2.445134137142996,
        3.754408661907416};

    constexpr double kLowTail = 0.02425;
    constexpr double kHighTail = 1.0 - kLowTail;

    double tail_ratio(double q)
    {
        return (((((kC[0] * q + kC[1]) * q + kC[2]) * q + kC[3]) * q + kC[4]) * q + kC[5]) /
               ((((kD[0] * q + kD[1]) * q + kD[2]) * q + kD[3]) * q + 1.0);
    }

    double expected_demand_normal_clamped(double mean, double std_dev)
    {
        const double z = mean / std_dev;
        return mean * normal_cdf(z, 0.0, 1.0) + std_dev * normal_pdf(z, 0.0, 1.0);
    }
}

double clamp_value(double value, double min, double max)
{
    return std::min(std::max(value, min), max);
}

double erf_approx(double x)
{
    // The polynomial leaves a 1e-9 residue at the origin.
    if (x == 0.0)
    {
        return 0.0;
    }

    const double sign = x < 0 ? -1.0 : 1.0;
    const double abs_x = std::abs(x);
    const double a1 = 0.254829592;
    const double a2 = -0.284496736;
    const double a3 = 1.421413741;
    const double a4 = -1.453152027;
    const double a5 = 1.061405429;
    const double p = 0.3275911;

    const double t = 1.0 / (1.0 + p * abs_x);
    const double y = 1.0 - (((((a5 * t + a4) * t + a3) * t + a2) * t + a1) * t * std::exp(-abs_x * abs_x));
    return sign * y;
}

double normal_pdf(double x, double mean, double std_dev)
{
    const double variance = std_dev * std_dev;
    const double denominator = std::sqrt(2.0 * kPi * variance);
    const double exponent = -((x - mean) * (x - mean)) / (2.0 * variance);
    return std::exp(exponent) / denominator;
}

double normal_cdf(double x, double mean, double std_dev)
{
    return 0.5 * (1.0 + erf_approx((x - mean) / (std_dev * std::sqrt(2.0))));
}

double inverse_standard_normal_cdf(double p_input)
{
    const double p = clamp_value(p_input, kDemandEpsilon, 1.0 - kDemandEpsilon);

    if (p < kLowTail)
    {
        return tail_ratio(std::sqrt(-2.0 * std::log(p)));
    }
    if (p > kHighTail)
    {
        return -tail_ratio(std::sqrt(-2.0 * std::log(1.0 - p)));
    }

    const double q = p - 0.5;
    const double r = q * q;
    return (((((kA[0] * r + kA[1]) * r + kA[2]) * r + kA[3]) * r + kA[4]) * r + kA[5]) * q /
           (((((kB[0] * r + kB[1]) * r + kB[2]) * r + kB[3]) * r + kB[4]) * r + 1.0);
}

double inverse_normal_cdf(double p, double mean, double std_dev)
{
    return mean + std_dev * inverse_standard_normal_cdf(p);
}

double estimate_expected_sales_normal(double order_quantity, double mean, double std_dev, int steps)
{
    if (order_quantity <= 0)
    {
        return 0.0;
    }

    const double upper = std::max({mean + 6.0 * std_dev, order_quantity + 4.0 * std_dev, 0.0});
    const double lower = 0.0;
    const double width = (upper - lower) / steps;
    double integral = 0.0;

    for (int i = 0; i < steps; ++i)
    {
        const double demand = lower + (i + 0.5) * width;
        integral += std::min(order_quantity, demand) * normal_pdf(demand, mean, std_dev);
    }

    // Mass beyond the grid sells the full order quantity.
    const double upper_tail = std::max(0.0, 1.0 - normal_cdf(upper, mean, std_dev));
    return integral * width + order_quantity * upper_tail;
}

std::vector<std::pair<double, double>> sorted_support(const DiscreteDistribution &distribution)
{
    std::vector<std::pair<double, double>> points;
    points.reserve(distribution.values.size());
    for (size_t i = 0; i < distribution.values.size(); ++i)
    {
        const double probability = i < distribution.probabilities.size() ? distribution.probabilities[i] : 0.0;
        points.emplace_back(distribution.values[i], probability);
    }
    std::stable_sort(points.begin(), points.end(),
                     [](const auto &left, const auto &right)
                     { return left.first < right.first; });
    return points;
}

double expected_demand(const ParsedDistribution &distribution)
{
    return std::visit(
        [](auto &&dist) -> double
        {
            using T = std::decay_t<decltype(dist)>;
            if constexpr (std::is_same_v<T, NormalDistribution>)
            {
                return expected_demand_normal_clamped(dist.mean, dist.std_dev);
            }
            else if constexpr (std::is_same_v<T, UniformDistribution>)
            {
                return (dist.lower_bound + dist.upper_bound) / 2.0;
            }
            else
            {
                double sum = 0.0;
                for (const auto &[value, probability] : sorted_support(dist))
                {
                    sum += value * probability;
                }
                return sum;
            }
        },
        distribution);
}

double expected_sales(double order_quantity, const ParsedDistribution &distribution)
{
    const double q = std::max(0.0, order_quantity);

    return std::visit(
        [q](auto &&dist) -> double
        {
            using T = std::decay_t<decltype(dist)>;
            if constexpr (std::is_same_v<T, NormalDistribution>)
            {
                return estimate_expected_sales_normal(q, dist.mean, dist.std_dev);
            }
            else if constexpr (std::is_same_v<T, UniformDistribution>)
            {
                const double lower = dist.lower_bound;
                const double upper = dist.upper_bound;

                if (upper - lower <= kDemandEpsilon)
                {
                    return std::min(q, lower);
                }
                if (q <= lower)
                {
                    return q;
                }
                if (q >= upper)
                {
                    return (lower + upper) / 2.0;
                }

                const double first = (q * q - lower * lower) / 2.0;
                const double second = q * (upper - q);
                return (first + second) / (upper - lower);
            }
            else
            {
                double sum = 0.0;
                for (const auto &[value, probability] : sorted_support(dist))
                {
                    sum += std::min(q, value) * probability;
                }
                return sum;
            }
        },
        distribution);
}

double service_level(double order_quantity, const ParsedDistribution &distribution)
{
    const double q = std::max(0.0, order_quantity);

    return std::visit(
        [q](auto &&dist) -> double
        {
            using T = std::decay_t<decltype(dist)>;
            if constexpr (std::is_same_v<T, NormalDistribution>)
            {
                return clamp_value(normal_cdf(q, dist.mean, dist.std_dev), 0.0, 1.0);
            }
            else if constexpr (std::is_same_v<T, UniformDistribution>)
            {
                if (q <= dist.lower_bound)
                {
                    return 0.0;
                }
                if (q >= dist.upper_bound)
                {
                    return 1.0;
                }
                return clamp_value((q - dist.lower_bound) / (dist.upper_bound - dist.lower_bound), 0.0, 1.0);
            }
            else
            {
                double cumulative = 0.0;
                for (const auto &[value, probability] : sorted_support(dist))
                {
                    if (value <= q)
                    {
                        cumulative += probability;
                    }
                }
                return clamp_value(cumulative, 0.0, 1.0);
            }
        },
        distribution);
}

double quantile_for_distribution(double probability_input, const ParsedDistribution &distribution)
{
    const double probability = clamp_value(probability_input, 0.0, 1.0);

    return std::visit(
        [probability](auto &&dist) -> double
        {
            using T = std::decay_t<decltype(dist)>;
            if constexpr (std::is_same_v<T, NormalDistribution>)
            {
                if (probability <= normal_cdf(0.0, dist.mean, dist.std_dev))
                {
                    return 0.0;
                }
                return std::max(0.0, dist.mean + dist.std_dev * inverse_standard_normal_cdf(probability));
            }
            else if constexpr (std::is_same_v<T, UniformDistribution>)
            {
                return dist.lower_bound + probability * (dist.upper_bound - dist.lower_bound);
            }
            else
            {
                const auto points = sorted_support(dist);
                double cumulative = 0.0;
                for (const auto &[value, weight] : points)
                {
                    cumulative += weight;
                    if (cumulative + kDemandEpsilon >= probability)
                    {
                        return value;
                    }
                }
                return points.empty() ? 0.0 : points.back().first;
            }
        },
        distribution);
}
