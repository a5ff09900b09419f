#include "include/sce/core/ContractEngine.h"
#include "include/sce/core/EngineException.h"
#include "include/sce/core/EnumNames.h"
#include "include/sce/evaluators/evaluators.h"
#include "include/sce/validation/InputValidator.h"
#include "include/sce/io/io.h"

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <thread>

namespace
{
    const EvaluatorRegistry &contract_evaluator_registry()
    {
        static const EvaluatorRegistry registry = []
        {
            EvaluatorRegistry r;
            register_contract_evaluators(r);
            return r;
        }();
        return registry;
    }
}

CalculationResponse calculate_contract(const CalculationPayload &payload)
{
    ValidationOutcome outcome = validate_and_parse_payload(payload);
    if (!outcome.errors.empty() || !outcome.parsed)
    {
        return CalculationResponse{std::nullopt, std::move(outcome.errors)};
    }

    auto evaluator = contract_evaluator_registry().create(outcome.parsed->contract_type);
    if (!evaluator)
    {
        return CalculationResponse{
            std::nullopt,
            {"No evaluator is registered for contract type '" + to_string(outcome.parsed->contract_type) + "'."}};
    }
    return CalculationResponse{evaluator->evaluate(*outcome.parsed), {}};
}

ContractEngine::ContractEngine(const std::string &json_payload_path, bool is_preview)
    : m_num_threads(0), m_is_preview(is_preview)
{
    parse_and_build(json_payload_path);
}

std::string ContractEngine::get_output_file_path() const
{
    return m_output_file_path;
}

const std::vector<CalculationPayload> &ContractEngine::get_scenarios() const
{
    return m_scenarios;
}

void ContractEngine::parse_and_build(const std::string &path)
{
    std::ifstream file_stream(path);
    if (!file_stream.is_open())
    {
        throw EngineException(EngineErrc::PayloadFileNotFound, "Failed to open payload file: " + path);
    }
    json document;
    try
    {
        document = json::parse(file_stream);
    }
    catch (const json::parse_error &e)
    {
        throw EngineException(EngineErrc::PayloadParseError, "Failed to parse JSON payload: " + std::string(e.what()));
    }

    // A bare payload is a batch of one.
    if (!document.is_object() || !document.contains("scenarios"))
    {
        try
        {
            m_scenarios.push_back(payload_from_json(document));
        }
        catch (const json::out_of_range &e)
        {
            throw EngineException(EngineErrc::PayloadConfigError, "Missing required key in payload file: " + std::string(e.what()));
        }
        catch (const json::type_error &e)
        {
            throw EngineException(EngineErrc::PayloadConfigError, "Incorrect type for key in payload file: " + std::string(e.what()));
        }
    }
    else
    {
        try
        {
            if (document.contains("run_config"))
            {
                const auto &config = document.at("run_config");
                if (config.contains("output_file") && config.at("output_file").is_string())
                {
                    m_output_file_path = config.at("output_file").get<std::string>();
                }
                const int num_threads = config.value("num_threads", 0);
                if (num_threads < 0)
                {
                    throw EngineException(EngineErrc::PayloadConfigError, "run_config.num_threads cannot be negative.");
                }
                m_num_threads = static_cast<unsigned int>(num_threads);
            }
        }
        catch (const json::type_error &e)
        {
            throw EngineException(EngineErrc::PayloadConfigError, "Incorrect type for key in run_config: " + std::string(e.what()));
        }

        const auto &scenarios = document.at("scenarios");
        if (!scenarios.is_array() || scenarios.empty())
        {
            throw EngineException(EngineErrc::PayloadConfigError, "'scenarios' must be a non-empty array of payloads.");
        }

        int scenario_index = 0;
        for (const auto &scenario_json : scenarios)
        {
            try
            {
                m_scenarios.push_back(payload_from_json(scenario_json, scenario_index));
            }
            catch (const json::out_of_range &e)
            {
                throw EngineException(EngineErrc::PayloadConfigError, "Missing required key in payload file: " + std::string(e.what()), scenario_index);
            }
            catch (const json::type_error &e)
            {
                throw EngineException(EngineErrc::PayloadConfigError, "Incorrect type for key in payload file: " + std::string(e.what()), scenario_index);
            }
            ++scenario_index;
        }
    }

    if (!m_is_preview)
    {
        std::cout << "\n--- Loaded " << m_scenarios.size() << " scenario(s) from " << path << " ---" << std::endl;
    }
}

void ContractEngine::run_batch(size_t begin, size_t end, std::vector<CalculationResponse> &results, std::exception_ptr &out_exception)
{
    try
    {
        for (size_t i = begin; i < end; ++i)
        {
            results[i] = calculate_contract(m_scenarios[i]);
        }
    }
    catch (...)
    {
        out_exception = std::current_exception();
    }
}

std::vector<CalculationResponse> ContractEngine::run()
{
    const size_t num_scenarios = m_scenarios.size();
    std::vector<CalculationResponse> results(num_scenarios);
    if (num_scenarios == 0)
    {
        return results;
    }

    const unsigned int requested_threads = m_num_threads > 0 ? m_num_threads : std::max(1u, std::thread::hardware_concurrency());
    const size_t num_threads = std::min(static_cast<size_t>(requested_threads), num_scenarios);

    if (!m_is_preview)
    {
        std::cout << "\n--- Evaluating " << num_scenarios << " scenario(s) on " << num_threads << " thread(s) ---" << std::endl;
    }

    std::vector<std::exception_ptr> thread_exceptions(num_threads, nullptr);
    if (num_threads == 1)
    {
        run_batch(0, num_scenarios, results, thread_exceptions[0]);
    }
    else
    {
        // Contiguous slices keep every thread writing to its own result slots.
        const size_t scenarios_per_thread = num_scenarios / num_threads;
        const size_t remainder_scenarios = num_scenarios % num_threads;

        std::vector<std::thread> threads;
        size_t begin = 0;
        for (size_t i = 0; i < num_threads; ++i)
        {
            const size_t count = scenarios_per_thread + (i < remainder_scenarios ? 1 : 0);
            threads.emplace_back(&ContractEngine::run_batch, this, begin, begin + count, std::ref(results), std::ref(thread_exceptions[i]));
            begin += count;
        }
        for (auto &t : threads)
        {
            t.join();
        }
    }

    for (const auto &ex_ptr : thread_exceptions)
    {
        if (ex_ptr)
        {
            std::rethrow_exception(ex_ptr);
        }
    }
    return results;
}
