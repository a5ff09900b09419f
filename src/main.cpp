#include "include/sce/core/ContractEngine.h"
#include "include/sce/core/EngineException.h"
#include "include/sce/core/EnumNames.h"
#include "include/sce/contracts/ContractCatalog.h"
#include "include/sce/io/io.h"
#include "include/sce/validation/number_parsing.h"
#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

void print_report(size_t scenario_index, const CalculationPayload &payload, const CalculationResponse &response);

std::string metric_value_text(const MetricValue &value)
{
    if (const auto *number = std::get_if<double>(&value))
    {
        return format_number(*number);
    }
    return std::get<std::string>(value);
}

void print_usage(const char *program)
{
    std::cerr << "Usage: " << program << " [--preview] <path_to_payload.json>\n"
              << "       " << program << " --template <contractType> [standard|optimization]\n"
              << "       " << program << " --list-contracts" << std::endl;
}

bool has_errors(const std::vector<CalculationResponse> &responses)
{
    return std::any_of(responses.begin(), responses.end(), [](const CalculationResponse &r)
                       { return !r.errors.empty(); });
}

int run_preview_mode(const std::string &payload_path)
{
    ContractEngine engine(payload_path, true);
    std::vector<CalculationResponse> responses = engine.run();

    json output_json;
    output_json["status"] = "success";
    output_json["responses"] = json::array();
    for (const auto &response : responses)
    {
        output_json["responses"].push_back(response_to_json(response));
    }
    std::cout << output_json.dump() << std::endl;
    return has_errors(responses) ? 1 : 0;
}

int run_report_mode(const std::string &payload_path)
{
    ContractEngine engine(payload_path);
    std::vector<CalculationResponse> responses = engine.run();

    const auto &scenarios = engine.get_scenarios();
    for (size_t i = 0; i < responses.size(); ++i)
    {
        print_report(i, scenarios[i], responses[i]);
    }

    std::string output_path = engine.get_output_file_path();
    if (!output_path.empty())
    {
        write_charts_to_csv(output_path, responses);
    }
    std::cout << "\nExecution finished." << std::endl;
    return has_errors(responses) ? 1 : 0;
}

int print_template(const std::string &contract_name, const std::optional<std::string> &mode_name)
{
    auto type = parse_contract_type(contract_name);
    if (!type)
    {
        std::cerr << "Unknown contract type: " << contract_name << std::endl;
        return 1;
    }
    std::optional<OptionEvaluationMode> mode;
    if (mode_name)
    {
        mode = parse_option_evaluation_mode(*mode_name);
        if (!mode)
        {
            std::cerr << "Unknown evaluation mode: " << *mode_name << std::endl;
            return 1;
        }
    }
    std::cout << payload_to_json(make_default_payload(*type, mode)).dump(4) << std::endl;
    return 0;
}

void print_fields(const std::vector<FieldDescriptor> &fields)
{
    for (const auto &field : fields)
    {
        std::cout << "  " << field.key << ": " << field.display_label << std::endl;
    }
}

void print_mode_header(const std::string &label, bool is_default)
{
    std::cout << "  [" << label << (is_default ? " (default)" : "") << "]" << std::endl;
}

void print_contract_list()
{
    for (ContractType type : all_contract_types())
    {
        const ContractDefinition &definition = contract_definition(type);
        std::cout << "\n--- " << definition.name << " (" << to_string(type) << ") ---" << std::endl;
        std::cout << definition.description << std::endl;
        std::cout << "Note: " << definition.teaching_note << std::endl;
        std::cout << "Key outcome: " << definition.key_outcome_label << std::endl;

        const auto &modes = definition.option_modes;
        if (modes)
        {
            print_mode_header(modes->standard_label, modes->default_mode == OptionEvaluationMode::Standard);
        }
        print_fields(definition.fields);
        if (modes)
        {
            print_mode_header(modes->optimization_label, modes->default_mode == OptionEvaluationMode::Optimization);
            print_fields(modes->optimization_fields);
        }
    }
}

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    const std::string first_arg = argv[1];
    if (first_arg == "--list-contracts" && argc == 2)
    {
        print_contract_list();
        return 0;
    }
    if (first_arg == "--template" && (argc == 3 || argc == 4))
    {
        return print_template(argv[2], argc == 4 ? std::optional<std::string>(argv[3]) : std::nullopt);
    }

    std::string payload_path;
    bool preview_mode = false;

    if (argc == 3 && first_arg == "--preview")
    {
        preview_mode = true;
        payload_path = argv[2];
    }
    else if (argc == 2 && first_arg.rfind("--", 0) != 0)
    {
        payload_path = first_arg;
    }
    else
    {
        print_usage(argv[0]);
        return 1;
    }

    try
    {
        return preview_mode ? run_preview_mode(payload_path) : run_report_mode(payload_path);
    }
    catch (const EngineException &e)
    {
        if (preview_mode)
        {
            json error_json;
            error_json["status"] = "error";
            error_json["message"] = e.what();
            std::cout << error_json.dump() << std::endl;
        }
        else
        {
            std::cerr << "An error occurred: " << e.what() << std::endl;
        }
        return 1;
    }
    catch (const std::exception &e)
    {
        if (preview_mode)
        {
            json error_json;
            error_json["status"] = "error";
            error_json["message"] = e.what();
            std::cout << error_json.dump() << std::endl;
        }
        else
        {
            std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        }
        return 1;
    }
}

void print_report(size_t scenario_index, const CalculationPayload &payload, const CalculationResponse &response)
{
    std::cout << "\n--- Scenario " << scenario_index + 1 << ": " << contract_definition(payload.contract_type).name;
    if (payload.contract_type == ContractType::OptionContract)
    {
        std::cout << " (" << to_string(payload.option_evaluation_mode) << ")";
    }
    std::cout << " ---" << std::endl;

    if (!response.result)
    {
        std::cerr << "Validation failed for scenario " << scenario_index + 1 << ":" << std::endl;
        for (const auto &error : response.errors)
        {
            std::cerr << "  - " << error << std::endl;
        }
        return;
    }

    const CalculationResult &result = *response.result;
    std::cout << "Decision: " << result.key_decision << std::endl;
    if (result.metrics_section_title)
    {
        std::cout << *result.metrics_section_title << std::endl;
    }
    for (const auto &metric : result.metrics)
    {
        std::cout << (metric.emphasize ? "* " : "  ") << metric.label << ": " << metric_value_text(metric.value) << std::endl;
    }
    for (const auto &chart : result.charts)
    {
        std::cout << "  [chart] " << chart.title << " (" << chart.rows.size() << " points)" << std::endl;
    }
    for (const auto &warning : result.warnings)
    {
        std::cout << "Warning: " << warning << std::endl;
    }
    for (const auto &note : result.notes)
    {
        std::cout << "Note: " << note << std::endl;
    }
}
