#pragma once
#include "include/sce/evaluators/EvaluatorRegistry.h"

void register_contract_evaluators(EvaluatorRegistry &registry);
