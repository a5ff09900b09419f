#include "include/sce/io/io.h"
#include "include/sce/core/EngineException.h"
#include "include/sce/core/EnumNames.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace
{
    // Numbers are accepted where the payload expects text and kept in their JSON spelling.
    std::string text_field(const json &object, const std::string &key, int scenario_index)
    {
        if (!object.contains(key) || object.at(key).is_null())
        {
            return "";
        }
        const auto &value = object.at(key);
        if (value.is_string())
        {
            return value.get<std::string>();
        }
        if (value.is_number())
        {
            return value.dump();
        }
        throw EngineException(EngineErrc::PayloadConfigError, "Field '" + key + "' must be a string or a number.", scenario_index);
    }

    template <typename Enum>
    Enum enum_field(const json &object, const std::string &key, Enum fallback,
                    std::optional<Enum> (*parse)(const std::string &), EngineErrc errc, int scenario_index)
    {
        if (!object.contains(key))
        {
            return fallback;
        }
        const std::string name = object.at(key).get<std::string>();
        auto parsed = parse(name);
        if (!parsed)
        {
            throw EngineException(errc, "Unknown value '" + name + "' for '" + key + "'.", scenario_index);
        }
        return *parsed;
    }

    json cell_to_json(const ChartCell &cell)
    {
        return std::visit([](auto &&value) -> json
                          { return value; },
                          cell);
    }

    json series_to_json(const std::vector<SeriesConfig> &series)
    {
        json out = json::array();
        for (const auto &s : series)
        {
            out.push_back({{"dataKey", s.data_key}, {"name", s.name}, {"color", s.color}});
        }
        return out;
    }

    json chart_to_json(const ChartConfig &chart)
    {
        json out;
        out["title"] = chart.title;
        out["subtitle"] = chart.subtitle;
        out["chartType"] = to_string(chart.chart_type);
        out["xKey"] = chart.x_key;
        out["xLabel"] = chart.x_label;
        out["yLabel"] = chart.y_label;

        json data = json::array();
        for (const auto &row : chart.rows)
        {
            json point = json::object();
            for (size_t i = 0; i < row.size() && i < chart.columns.size(); ++i)
            {
                point[chart.columns[i]] = cell_to_json(row[i]);
            }
            data.push_back(std::move(point));
        }
        out["data"] = std::move(data);

        if (!chart.lines.empty())
        {
            out["lines"] = series_to_json(chart.lines);
        }
        if (!chart.bars.empty())
        {
            out["bars"] = series_to_json(chart.bars);
        }
        if (chart.reference_x)
        {
            out["referenceX"] = {{"value", chart.reference_x->value},
                                 {"label", chart.reference_x->label},
                                 {"color", chart.reference_x->color}};
        }
        return out;
    }

    json result_to_json(const CalculationResult &result)
    {
        json out;
        out["keyDecision"] = result.key_decision;

        json metrics = json::array();
        for (const auto &metric : result.metrics)
        {
            json card;
            card["label"] = metric.label;
            card["value"] = std::visit([](auto &&value) -> json
                                       { return value; },
                                       metric.value);
            card["emphasize"] = metric.emphasize;
            card["tone"] = to_string(metric.tone);
            metrics.push_back(std::move(card));
        }
        out["metrics"] = std::move(metrics);

        if (result.metrics_section_title)
        {
            out["metricsSectionTitle"] = *result.metrics_section_title;
        }

        json charts = json::array();
        for (const auto &chart : result.charts)
        {
            charts.push_back(chart_to_json(chart));
        }
        out["charts"] = std::move(charts);

        if (!result.warnings.empty())
        {
            out["warnings"] = result.warnings;
        }
        if (!result.notes.empty())
        {
            out["notes"] = result.notes;
        }
        return out;
    }
}

CalculationPayload payload_from_json(const json &document, int scenario_index)
{
    if (!document.is_object())
    {
        throw EngineException(EngineErrc::PayloadConfigError, "A payload must be a JSON object.", scenario_index);
    }

    CalculationPayload payload;
    const std::string contract_name = document.at("contractType").get<std::string>();
    auto contract_type = parse_contract_type(contract_name);
    if (!contract_type)
    {
        throw EngineException(EngineErrc::UnknownContractType, "Unknown contract type: " + contract_name, scenario_index);
    }
    payload.contract_type = *contract_type;
    payload.option_evaluation_mode = enum_field(document, "optionEvaluationMode", OptionEvaluationMode::Standard,
                                                &parse_option_evaluation_mode, EngineErrc::UnknownEvaluationMode, scenario_index);

    if (document.contains("inputs"))
    {
        const auto &inputs = document.at("inputs");
        if (!inputs.is_object())
        {
            throw EngineException(EngineErrc::PayloadConfigError, "'inputs' must be an object of field values.", scenario_index);
        }
        for (auto it = inputs.begin(); it != inputs.end(); ++it)
        {
            payload.inputs[it.key()] = text_field(inputs, it.key(), scenario_index);
        }
    }

    if (document.contains("demandSettings"))
    {
        const auto &demand = document.at("demandSettings");
        DemandSettings &settings = payload.demand_settings;
        settings.demand_type = enum_field(demand, "demandType", DemandType::Deterministic,
                                          &parse_demand_type, EngineErrc::UnknownDemandType, scenario_index);
        settings.distribution_type = enum_field(demand, "distributionType", DistributionType::Normal,
                                                &parse_distribution_type, EngineErrc::UnknownDistributionType, scenario_index);
        settings.demand = text_field(demand, "demand", scenario_index);
        settings.mean = text_field(demand, "mean", scenario_index);
        settings.std_dev = text_field(demand, "stdDev", scenario_index);
        settings.lower_bound = text_field(demand, "lowerBound", scenario_index);
        settings.upper_bound = text_field(demand, "upperBound", scenario_index);
        settings.discrete_values = text_field(demand, "discreteValues", scenario_index);
        settings.discrete_probabilities = text_field(demand, "discreteProbabilities", scenario_index);
    }

    if (document.contains("toggles"))
    {
        const auto &toggles = document.at("toggles");
        payload.toggles.include_salvage = toggles.value("includeSalvage", false);
        payload.toggles.include_holding = toggles.value("includeHolding", false);
        payload.toggles.include_shortage = toggles.value("includeShortage", false);
        payload.toggles.include_penalty = toggles.value("includePenalty", false);
    }

    if (document.contains("costInputs"))
    {
        const auto &costs = document.at("costInputs");
        payload.cost_inputs.salvage_value = text_field(costs, "salvageValue", scenario_index);
        payload.cost_inputs.holding_cost = text_field(costs, "holdingCost", scenario_index);
        payload.cost_inputs.shortage_cost = text_field(costs, "shortageCost", scenario_index);
        payload.cost_inputs.penalty_cost = text_field(costs, "penaltyCost", scenario_index);
    }
    return payload;
}

json payload_to_json(const CalculationPayload &payload)
{
    json out;
    out["contractType"] = to_string(payload.contract_type);
    out["optionEvaluationMode"] = to_string(payload.option_evaluation_mode);
    out["inputs"] = payload.inputs;

    const DemandSettings &settings = payload.demand_settings;
    out["demandSettings"] = {
        {"demandType", to_string(settings.demand_type)},
        {"distributionType", to_string(settings.distribution_type)},
        {"demand", settings.demand},
        {"mean", settings.mean},
        {"stdDev", settings.std_dev},
        {"lowerBound", settings.lower_bound},
        {"upperBound", settings.upper_bound},
        {"discreteValues", settings.discrete_values},
        {"discreteProbabilities", settings.discrete_probabilities}};

    out["toggles"] = {
        {"includeSalvage", payload.toggles.include_salvage},
        {"includeHolding", payload.toggles.include_holding},
        {"includeShortage", payload.toggles.include_shortage},
        {"includePenalty", payload.toggles.include_penalty}};

    out["costInputs"] = {
        {"salvageValue", payload.cost_inputs.salvage_value},
        {"holdingCost", payload.cost_inputs.holding_cost},
        {"shortageCost", payload.cost_inputs.shortage_cost},
        {"penaltyCost", payload.cost_inputs.penalty_cost}};
    return out;
}

json response_to_json(const CalculationResponse &response)
{
    json out;
    out["result"] = response.result ? result_to_json(*response.result) : json(nullptr);
    out["errors"] = response.errors;
    return out;
}

void write_charts_to_csv(const std::string &path, const std::vector<CalculationResponse> &responses)
{
    std::ofstream output_file(path);
    if (!output_file.is_open())
    {
        throw EngineException(EngineErrc::OutputFileWriteFailed, "Could not open output file '" + path + "' for writing.");
    }

    std::cout << "\n--- Writing charts to " << path << " ---" << std::endl;
    output_file << std::setprecision(12);

    size_t num_charts = 0;
    for (const auto &response : responses)
    {
        if (!response.result)
            continue;
        for (const auto &chart : response.result->charts)
        {
            if (num_charts > 0)
            {
                output_file << "\n";
            }
            output_file << "# " << chart.title << "\n";
            for (size_t i = 0; i < chart.columns.size(); ++i)
            {
                output_file << chart.columns[i] << (i == chart.columns.size() - 1 ? "" : ",");
            }
            output_file << "\n";
            for (const auto &row : chart.rows)
            {
                for (size_t i = 0; i < row.size(); ++i)
                {
                    std::visit([&](auto &&cell)
                               { output_file << cell; },
                               row[i]);
                    output_file << (i == row.size() - 1 ? "" : ",");
                }
                output_file << "\n";
            }
            ++num_charts;
        }
    }

    std::cout << "Successfully wrote " << num_charts << " chart(s)." << std::endl;
}
