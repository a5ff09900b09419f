#pragma once

#include "include/sce/core/datastructures.h"
#include <string>
#include <vector>

// Reads one payload document. Inputs may be JSON strings or numbers; unknown enum names
// throw EngineException. scenario_index, when given, prefixes error messages.
CalculationPayload payload_from_json(const json &document, int scenario_index = -1);
json payload_to_json(const CalculationPayload &payload);

json response_to_json(const CalculationResponse &response);

// One block per chart: a "# <title>" line, the column keys, then the sample rows.
void write_charts_to_csv(const std::string &path, const std::vector<CalculationResponse> &responses);
