#pragma once

#include "include/sce/core/datastructures.h"
#include <optional>
#include <string>

// Wire names match the payload JSON ("wholesale", "revenueSharing", ...).
std::string to_string(ContractType type);
std::string to_string(OptionEvaluationMode mode);
std::string to_string(DemandType type);
std::string to_string(DistributionType type);
std::string to_string(MetricTone tone);
std::string to_string(ChartType type);

std::optional<ContractType> parse_contract_type(const std::string &name);
std::optional<OptionEvaluationMode> parse_option_evaluation_mode(const std::string &name);
std::optional<DemandType> parse_demand_type(const std::string &name);
std::optional<DistributionType> parse_distribution_type(const std::string &name);

const std::vector<ContractType> &all_contract_types();
