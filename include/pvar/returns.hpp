#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include <pvar/price_table.hpp>

namespace pvar {

struct ReturnSeries {
    std::vector<std::string> dates; // empty for an undated series
    std::vector<double> values;

    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
    [[nodiscard]] bool empty() const noexcept { return values.empty(); }
};

// (rows - 1) x cols matrix of simple returns, p[t] / p[t-1] - 1.
Eigen::MatrixXd compute_asset_returns(const PriceTable& table);

// Weighted daily portfolio returns. weights are fractions, one per column;
// throws DimensionMismatch otherwise.
ReturnSeries compute_portfolio_returns(const PriceTable& table,
                                       const std::vector<double>& weights);

} // namespace pvar
