#pragma once
#include "include/sce/core/IContractEvaluator.h"

// Retailer/supplier profit split when part of sales revenue is shared.
class RevenueSharingEvaluator : public IContractEvaluator
{
public:
    CalculationResult evaluate(const ParsedCalculationPayload &payload) const override;
};
