#pragma once

#include "Errors.h"
#include <stdexcept>
#include <string>

class EngineException : public std::runtime_error
{
public:
    // scenario_index is zero-based; it is reported one-based in the message.
    EngineException(EngineErrc code, const std::string &message, int scenario_index = -1)
        : std::runtime_error(format_message(scenario_index, message)),
          m_code(code),
          m_scenario_index(scenario_index)
    {
    }

    EngineErrc code() const noexcept { return m_code; }
    int scenario_index() const noexcept { return m_scenario_index; }

private:
    EngineErrc m_code;
    int m_scenario_index;

    static std::string format_message(int scenario_index, const std::string &message)
    {
        if (scenario_index >= 0)
        {
            return "Scenario " + std::to_string(scenario_index + 1) + ": " + message;
        }
        return message;
    }
};
