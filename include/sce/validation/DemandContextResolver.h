#pragma once

#include "include/sce/core/datastructures.h"
#include <optional>
#include <string>
#include <vector>

// Builds the demand context from raw settings. On failure the reasons are appended to
// errors and nullopt is returned; a partial context is never produced.
std::optional<ParsedDemandContext> resolve_demand_context(const DemandSettings &settings,
                                                          std::vector<std::string> &errors);

std::optional<DiscreteDistribution> validate_discrete_distribution(const std::string &values_raw,
                                                                   const std::string &probabilities_raw,
                                                                   std::vector<std::string> &errors);
