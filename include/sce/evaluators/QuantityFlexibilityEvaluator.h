#pragma once
#include "include/sce/core/IContractEvaluator.h"

// Procurement cost when the final order may move within a band around a commitment.
class QuantityFlexibilityEvaluator : public IContractEvaluator
{
public:
    CalculationResult evaluate(const ParsedCalculationPayload &payload) const override;
};
