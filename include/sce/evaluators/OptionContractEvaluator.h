#pragma once
#include "include/sce/core/IContractEvaluator.h"

// Dispatches on the option evaluation mode: standard mode prices a given option position
// against spot purchasing, optimization mode solves the newsvendor problem for the
// option quantity and compares it with long-term contracting.
class OptionContractEvaluator : public IContractEvaluator
{
public:
    CalculationResult evaluate(const ParsedCalculationPayload &payload) const override;

private:
    CalculationResult evaluate_standard(const ParsedCalculationPayload &payload) const;
    CalculationResult evaluate_optimization(const ParsedCalculationPayload &payload) const;
};
