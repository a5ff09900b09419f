#pragma once

#include "include/sce/core/IContractEvaluator.h"
#include <functional>
#include <map>
#include <memory>

class EvaluatorRegistry
{
public:
    using FactoryFunc = std::function<std::unique_ptr<IContractEvaluator>()>;

    void register_evaluator(ContractType type, FactoryFunc factory);

    // Returns nullptr when nothing is registered for the type.
    std::unique_ptr<IContractEvaluator> create(ContractType type) const;

    const std::map<ContractType, FactoryFunc> &get_factory_map() const;

private:
    std::map<ContractType, FactoryFunc> m_factory_map;
};
