#include <pvar/weights.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

#include <pvar/errors.hpp>
#include <pvar/utils.hpp>

namespace pvar {

std::vector<double> parse_weights(std::string_view text) {
    if (trim(text).empty()) {
        throw InvalidWeights("no weights supplied");
    }

    std::vector<double> percentages;
    const auto fields = split_fields(text);
    percentages.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const std::string& token = fields[i];
        if (token.empty()) {
            throw InvalidWeights("empty weight at position " + std::to_string(i + 1));
        }
        double value = 0.0;
        size_t idx = 0;
        try {
            value = std::stod(token, &idx);
        } catch (const std::invalid_argument&) {
            throw InvalidWeights("invalid weight '" + token + "'");
        } catch (const std::out_of_range&) {
            throw InvalidWeights("weight out of range '" + token + "'");
        }
        if (idx != token.size()) {
            throw InvalidWeights("invalid weight '" + token + "'");
        }
        if (!std::isfinite(value)) {
            throw InvalidWeights("weight must be finite '" + token + "'");
        }
        percentages.push_back(value);
    }
    return percentages;
}

std::vector<double> normalize_weights(const std::vector<double>& percentages) {
    if (percentages.empty()) {
        throw InvalidWeights("no weights supplied");
    }

    double sum = 0.0;
    for (double p : percentages) {
        if (!std::isfinite(p)) {
            throw InvalidWeights("weights must be finite");
        }
        sum += p;
    }
    if (std::abs(sum - 100.0) > kWeightSumTolerance) {
        throw InvalidWeights("weights must sum to 100, got " + std::to_string(sum));
    }

    std::vector<double> fractions;
    fractions.reserve(percentages.size());
    for (double p : percentages) {
        fractions.push_back(p / 100.0);
    }
    return fractions;
}

} // namespace pvar
