#pragma once
#include "include/sce/core/IContractEvaluator.h"

// Newsvendor profit for a single order under a fixed wholesale price.
class WholesaleEvaluator : public IContractEvaluator
{
public:
    CalculationResult evaluate(const ParsedCalculationPayload &payload) const override;
};
