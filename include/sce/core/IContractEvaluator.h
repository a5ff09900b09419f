#pragma once
#include "datastructures.h"

class IContractEvaluator
{
public:
    virtual ~IContractEvaluator() = default;
    virtual CalculationResult evaluate(const ParsedCalculationPayload &payload) const = 0;
};
