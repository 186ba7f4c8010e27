#pragma once

#include <cstddef>
#include <vector>

#include <pvar/price_table.hpp>
#include <pvar/returns.hpp>

namespace pvar {

struct RiskEstimate {
    double pct = 0.0;        // return fraction, negative for a loss
    double confidence = 0.0; // percent
    std::size_t window = 0;  // days
    bool has_data = false;   // false when pct is the empty-sample sentinel

    [[nodiscard]] double amount(double portfolio_value) const;
};

struct VarConfig {
    std::size_t window = 20;
    double confidence = 95.0;
    double portfolio_value = 100000.0;
};

struct VarReport {
    ReturnSeries daily;
    ReturnSeries rolling;
    RiskEstimate historical;
    RiskEstimate parametric;
    RiskEstimate conditional;
};

// weights are fractions summing to 1, one per table column.
VarReport compute_var_report(const PriceTable& table,
                             const std::vector<double>& weights,
                             const VarConfig& config);

} // namespace pvar
