#pragma once

#include <optional>
#include <string>
#include <vector>

// Tolerance on the discrete probability sum.
constexpr double kProbabilitySumTolerance = 1e-3;

// Reads the whole (trimmed) text as a finite number. Empty text, trailing garbage,
// infinities and NaN all yield nullopt; underflow yields 0.
std::optional<double> parse_finite_number(const std::string &raw);

// Parses a non-negative number (strictly positive when requested), appending a
// "<label> ..." sentence to errors on failure. Blank text is read as 0.
std::optional<double> parse_number(const std::string &raw, const std::string &label,
                                   std::vector<std::string> &errors, bool strictly_positive = false);

// Splits on commas and whitespace. Tokens that are not numbers become NaN.
std::vector<double> parse_number_array(const std::string &raw);

// Shortest readable rendering used in messages: 100, 0.25, 187.45.
std::string format_number(double value);
