#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pvar {

// Linear interpolation between order statistics at rank q * (n - 1).
// Partially reorders data.
double quantile_inplace(std::vector<double>& data, double q);

double mean(std::span<const double> values);

// Divisor n - 1. Requires at least two values.
double sample_stddev(std::span<const double> values);

// Rounds half away from zero to two decimal places.
double round_to_cents(double value);

// Maps a confidence level in percent to its left-tail probability,
// e.g. 95 -> 0.05. Throws UnsupportedConfidenceLevel outside (0, 100).
double tail_probability(double confidence);

std::string trim(std::string_view input);

std::vector<std::string> split_fields(std::string_view line, char delimiter = ',');

} // namespace pvar
