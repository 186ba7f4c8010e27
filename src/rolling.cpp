#include <pvar/rolling.hpp>

#include <stdexcept>

namespace pvar {

ReturnSeries compound_rolling(const ReturnSeries& daily, std::size_t window) {
    if (window == 0) {
        throw std::invalid_argument("rolling window must be at least one day");
    }
    const bool dated = !daily.dates.empty();
    if (dated && daily.dates.size() != daily.values.size()) {
        throw std::invalid_argument("return series date index size mismatch");
    }

    ReturnSeries rolling;
    const std::size_t n = daily.size();
    if (n < window) {
        return rolling;
    }

    const std::size_t count = n - window + 1;
    rolling.values.reserve(count);
    if (dated) {
        rolling.dates.reserve(count);
    }
    for (std::size_t k = 0; k < count; ++k) {
        double growth = 1.0;
        for (std::size_t j = 0; j < window; ++j) {
            growth *= 1.0 + daily.values[k + j];
        }
        rolling.values.push_back(growth - 1.0);
        if (dated) {
            rolling.dates.push_back(daily.dates[k + window - 1]);
        }
    }
    return rolling;
}

} // namespace pvar
