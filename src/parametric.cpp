#include <pvar/parametric.hpp>

#include <cmath>
#include <stdexcept>

#include <pvar/normal.hpp>
#include <pvar/utils.hpp>

namespace pvar {

double parametric_var(std::span<const double> daily_returns,
                      double confidence,
                      std::size_t window) {
    const double z = normal_quantile(tail_probability(confidence));
    if (window == 0) {
        throw std::invalid_argument("rolling window must be at least one day");
    }
    if (daily_returns.size() < 2) {
        return 0.0;
    }

    const double mu = mean(daily_returns);
    const double sigma = sample_stddev(daily_returns);
    return (mu + z * sigma) * std::sqrt(static_cast<double>(window));
}

} // namespace pvar
