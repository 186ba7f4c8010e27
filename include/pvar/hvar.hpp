#pragma once

#include <span>

namespace pvar {

// Empirical (100 - confidence)th percentile of the rolling returns.
// Returns 0.0 for an empty sample.
double historical_var(std::span<const double> rolling_returns, double confidence);

// Mean of the rolling returns at or below the historical VaR cutoff.
// Returns 0.0 for an empty sample.
double conditional_var(std::span<const double> rolling_returns, double confidence);

} // namespace pvar
