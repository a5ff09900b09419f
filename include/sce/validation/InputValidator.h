#pragma once

#include "include/sce/core/datastructures.h"
#include <optional>
#include <string>
#include <vector>

struct ValidationOutcome
{
    std::optional<ParsedCalculationPayload> parsed;
    std::vector<std::string> errors;
};

// Parses every required field, cross-field rule, demand setting and enabled cost, collecting
// all errors. parsed is set only when errors is empty.
ValidationOutcome validate_and_parse_payload(const CalculationPayload &payload);
