#include "test_helpers.h"
#include "include/sce/evaluators/evaluators.h"
#include "include/sce/evaluators/evaluators_registration.h"

class EvaluatorRegistryTest : public ::testing::Test
{
};

TEST_F(EvaluatorRegistryTest, EveryContractTypeIsRegistered)
{
    EvaluatorRegistry registry;
    register_contract_evaluators(registry);
    EXPECT_EQ(registry.get_factory_map().size(), all_contract_types().size());
    for (ContractType type : all_contract_types())
    {
        SCOPED_TRACE(to_string(type));
        EXPECT_NE(registry.create(type), nullptr);
    }
}

TEST_F(EvaluatorRegistryTest, DuplicateRegistrationIsADeveloperError)
{
    EvaluatorRegistry registry;
    register_wholesale_evaluator(registry);
    try
    {
        register_wholesale_evaluator(registry);
        FAIL() << "Expected EngineException for duplicate registration.";
    }
    catch (const EngineException &e)
    {
        EXPECT_EQ(e.code(), EngineErrc::EvaluatorAlreadyRegistered);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("'wholesale' is already registered"));
    }
}

TEST_F(EvaluatorRegistryTest, UnregisteredTypeYieldsNull)
{
    EvaluatorRegistry registry;
    register_buyback_evaluator(registry);
    EXPECT_EQ(registry.create(ContractType::Wholesale), nullptr);
    EXPECT_NE(registry.create(ContractType::Buyback), nullptr);
}
