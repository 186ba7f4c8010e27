#pragma once

#include <cstddef>
#include <span>

namespace pvar {

// (mean + z * stddev) * sqrt(window) over daily returns, z being the left-tail
// standard normal quantile. Returns 0.0 with fewer than two observations.
double parametric_var(std::span<const double> daily_returns,
                      double confidence,
                      std::size_t window);

} // namespace pvar
