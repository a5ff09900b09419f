#include "include/sce/evaluators/EvaluatorRegistry.h"
#include "include/sce/core/EngineException.h"
#include "include/sce/core/EnumNames.h"

void EvaluatorRegistry::register_evaluator(ContractType type, FactoryFunc factory)
{
    if (m_factory_map.count(type) > 0)
    {
        throw EngineException(EngineErrc::EvaluatorAlreadyRegistered,
                              "Developer error: Evaluator for '" + to_string(type) + "' is already registered.");
    }
    m_factory_map[type] = std::move(factory);
}

std::unique_ptr<IContractEvaluator> EvaluatorRegistry::create(ContractType type) const
{
    auto it = m_factory_map.find(type);
    if (it == m_factory_map.end())
    {
        return nullptr;
    }
    return it->second();
}

const std::map<ContractType, EvaluatorRegistry::FactoryFunc> &EvaluatorRegistry::get_factory_map() const
{
    return m_factory_map;
}
