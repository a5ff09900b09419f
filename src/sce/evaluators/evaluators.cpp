#include "include/sce/evaluators/evaluators.h"
#include "include/sce/evaluators/evaluators_registration.h"

// --- Domain Orchestrator ---
// One registration per contract type.
void register_contract_evaluators(EvaluatorRegistry &registry)
{
    register_wholesale_evaluator(registry);
    register_buyback_evaluator(registry);
    register_revenue_sharing_evaluator(registry);
    register_option_contract_evaluator(registry);
    register_quantity_flexibility_evaluator(registry);
}
