#pragma once

#include <variant>
#include <vector>

struct NormalDistribution
{
    double mean;
    double std_dev;
};

struct UniformDistribution
{
    double lower_bound;
    double upper_bound;
};

// Support values are kept in input order; consumers sort before accumulating.
struct DiscreteDistribution
{
    std::vector<double> values;
    std::vector<double> probabilities;
};

using ParsedDistribution = std::variant<NormalDistribution, UniformDistribution, DiscreteDistribution>;

struct DeterministicDemand
{
    double demand;
};

struct RandomDemand
{
    ParsedDistribution distribution;
    double expected_demand;
};

using ParsedDemandContext = std::variant<DeterministicDemand, RandomDemand>;
