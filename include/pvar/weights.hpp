#pragma once

#include <string_view>
#include <vector>

namespace pvar {

inline constexpr double kWeightSumTolerance = 1e-6;

// "50, 30, 20" -> {50.0, 30.0, 20.0}
std::vector<double> parse_weights(std::string_view text);

// Percentages summing to 100 -> fractions summing to 1.
std::vector<double> normalize_weights(const std::vector<double>& percentages);

} // namespace pvar
