#include <pvar/hvar.hpp>

#include <cstddef>
#include <vector>

#include <pvar/utils.hpp>

namespace pvar {

double historical_var(std::span<const double> rolling_returns, double confidence) {
    const double q = tail_probability(confidence);
    if (rolling_returns.empty()) {
        return 0.0;
    }
    std::vector<double> sample(rolling_returns.begin(), rolling_returns.end());
    return quantile_inplace(sample, q);
}

double conditional_var(std::span<const double> rolling_returns, double confidence) {
    const double q = tail_probability(confidence);
    if (rolling_returns.empty()) {
        return 0.0;
    }

    std::vector<double> sample(rolling_returns.begin(), rolling_returns.end());
    const double cutoff = quantile_inplace(sample, q);

    double tail_sum = 0.0;
    std::size_t tail_count = 0;
    for (double r : rolling_returns) {
        if (r <= cutoff) {
            tail_sum += r;
            ++tail_count;
        }
    }
    // The interpolated cutoff is never below the sample minimum, so the tail is
    // non-empty unless the sample holds NaNs.
    if (tail_count == 0) {
        return cutoff;
    }
    return tail_sum / static_cast<double>(tail_count);
}

} // namespace pvar
