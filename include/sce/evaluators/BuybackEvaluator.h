#pragma once
#include "include/sce/core/IContractEvaluator.h"

// Retailer/manufacturer profit split when unsold units are repurchased.
class BuybackEvaluator : public IContractEvaluator
{
public:
    CalculationResult evaluate(const ParsedCalculationPayload &payload) const override;
};
