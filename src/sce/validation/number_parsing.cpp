#include "include/sce/validation/number_parsing.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace
{
    std::string trim(const std::string &text)
    {
        auto is_space = [](unsigned char c)
        { return std::isspace(c) != 0; };
        auto begin = std::find_if_not(text.begin(), text.end(), is_space);
        auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
        return begin < end ? std::string(begin, end) : std::string();
    }
}

std::optional<double> parse_finite_number(const std::string &raw)
{
    const std::string text = trim(raw);
    if (text.empty())
    {
        return std::nullopt;
    }

    // Underflow yields zero or a subnormal, both accepted.
    char *end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_number(const std::string &raw, const std::string &label,
                                   std::vector<std::string> &errors, bool strictly_positive)
{
    // Blank entries count as 0.
    const auto value = trim(raw).empty() ? std::optional<double>(0.0) : parse_finite_number(raw);
    if (!value)
    {
        errors.push_back(label + " must be a valid number.");
        return std::nullopt;
    }

    if (strictly_positive && *value <= 0)
    {
        errors.push_back(label + " must be greater than 0.");
        return std::nullopt;
    }

    if (!strictly_positive && *value < 0)
    {
        errors.push_back(label + " cannot be negative.");
        return std::nullopt;
    }

    return value;
}

std::vector<double> parse_number_array(const std::string &raw)
{
    std::string normalized = raw;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');

    std::vector<double> numbers;
    std::istringstream stream(normalized);
    std::string token;
    while (stream >> token)
    {
        numbers.push_back(parse_finite_number(token).value_or(std::numeric_limits<double>::quiet_NaN()));
    }
    return numbers;
}

std::string format_number(double value)
{
    std::ostringstream out;
    out << std::setprecision(12) << value;
    return out.str();
}
