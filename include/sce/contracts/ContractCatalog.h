#pragma once

#include "include/sce/core/datastructures.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct FieldDescriptor
{
    std::string key;
    std::string display_label;
    // Used verbatim as the subject of validation messages.
    std::string validation_label;
    bool strictly_positive = false;
};

using DefaultInputs = std::vector<std::pair<std::string, std::string>>;

struct OptionModeDefinition
{
    OptionEvaluationMode default_mode;
    std::string standard_label;
    std::string optimization_label;
    std::vector<FieldDescriptor> optimization_fields;
    DefaultInputs default_optimization_inputs;
};

struct ContractDefinition
{
    ContractType type;
    std::string name;
    std::string description;
    std::string teaching_note;
    std::string key_outcome_label;
    std::vector<FieldDescriptor> fields;
    DefaultInputs default_inputs;
    std::optional<OptionModeDefinition> option_modes;
};

const ContractDefinition &contract_definition(ContractType type);

// Fields the validator requires for this contract and option mode, in display order.
const std::vector<FieldDescriptor> &required_fields(ContractType type, OptionEvaluationMode mode);

// Starting-point payload: catalog defaults, deterministic demand and all cost toggles off.
// Without a mode the contract's default evaluation mode is used.
CalculationPayload make_default_payload(ContractType type,
                                        std::optional<OptionEvaluationMode> mode = std::nullopt);
