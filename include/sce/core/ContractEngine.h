#pragma once

#include "include/sce/core/datastructures.h"
#include <exception>
#include <string>
#include <vector>

// Validates the payload and runs the matching evaluator. Validation failures are returned
// as errors with no result; this function does not throw.
CalculationResponse calculate_contract(const CalculationPayload &payload);

class ContractEngine
{
public:
    explicit ContractEngine(const std::string &json_payload_path, bool is_preview = false);
    std::vector<CalculationResponse> run();
    std::string get_output_file_path() const;
    const std::vector<CalculationPayload> &get_scenarios() const;

private:
    void parse_and_build(const std::string &path);
    void run_batch(size_t begin, size_t end, std::vector<CalculationResponse> &results, std::exception_ptr &out_exception);

    std::vector<CalculationPayload> m_scenarios;
    std::string m_output_file_path;
    unsigned int m_num_threads;
    bool m_is_preview;
};
