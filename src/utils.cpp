#include <pvar/utils.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>

#include <pvar/errors.hpp>

namespace pvar {

double quantile_inplace(std::vector<double>& data, double q) {
    if (data.empty()) {
        throw std::invalid_argument("quantile_inplace requires non-empty data");
    }

    if (!std::isfinite(q)) {
        throw std::invalid_argument("quantile_inplace requires finite q");
    }

    q = std::clamp(q, 0.0, 1.0);
    const std::size_t n = data.size();

    if (n == 1) {
        return data.front();
    }

    const double rank = q * static_cast<double>(n - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(rank));
    const double frac = rank - static_cast<double>(lo);

    auto nth = data.begin() + static_cast<std::ptrdiff_t>(lo);
    std::nth_element(data.begin(), nth, data.end());
    const double lower = *nth;
    if (frac == 0.0 || lo + 1 >= n) {
        return lower;
    }

    // Everything past nth is >= lower; the smallest of it is order statistic lo + 1.
    const double upper = *std::min_element(std::next(nth), data.end());
    return lower + frac * (upper - lower);
}

double mean(std::span<const double> values) {
    if (values.empty()) {
        throw std::invalid_argument("mean requires non-empty data");
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double sample_stddev(std::span<const double> values) {
    if (values.size() < 2) {
        throw std::invalid_argument("sample_stddev requires at least two observations");
    }
    const double mu = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        const double d = v - mu;
        sum_sq += d * d;
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double round_to_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

double tail_probability(double confidence) {
    if (!std::isfinite(confidence) || confidence <= 0.0 || confidence >= 100.0) {
        throw UnsupportedConfidenceLevel("confidence level must be in (0,100), got " +
                                         std::to_string(confidence));
    }
    return (100.0 - confidence) / 100.0;
}

std::string trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::string{};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return std::string(input.substr(begin, end - begin + 1));
}

std::vector<std::string> split_fields(std::string_view line, char delimiter) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const auto pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.emplace_back(trim(line.substr(start)));
            break;
        }
        fields.emplace_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return fields;
}

} // namespace pvar
