#pragma once
#include "include/sce/evaluators/EvaluatorRegistry.h"

void register_wholesale_evaluator(EvaluatorRegistry &registry);
void register_buyback_evaluator(EvaluatorRegistry &registry);
void register_revenue_sharing_evaluator(EvaluatorRegistry &registry);
void register_option_contract_evaluator(EvaluatorRegistry &registry);
void register_quantity_flexibility_evaluator(EvaluatorRegistry &registry);
