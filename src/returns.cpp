#include <pvar/returns.hpp>

#include <stdexcept>
#include <string>

#include <pvar/errors.hpp>

namespace pvar {

namespace {

using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

} // namespace

Eigen::MatrixXd compute_asset_returns(const PriceTable& table) {
    const std::size_t T = table.rows();
    const std::size_t N = table.cols();
    if (table.closes.size() != T * N) {
        throw std::invalid_argument("price matrix size mismatch");
    }
    if (T < 2) {
        return Eigen::MatrixXd(0, static_cast<Eigen::Index>(N));
    }

    const Eigen::Map<const RowMajorMatrix> prices(table.closes.data(),
                                                  static_cast<Eigen::Index>(T),
                                                  static_cast<Eigen::Index>(N));
    const Eigen::Index steps = static_cast<Eigen::Index>(T - 1);

    // Zero or non-finite closes are not rejected; they surface as non-finite returns.
    Eigen::MatrixXd returns =
        ((prices.bottomRows(steps) - prices.topRows(steps)).array() / prices.topRows(steps).array())
            .matrix();
    return returns;
}

ReturnSeries compute_portfolio_returns(const PriceTable& table,
                                       const std::vector<double>& weights) {
    if (weights.size() != table.cols()) {
        throw DimensionMismatch("number of weights (" + std::to_string(weights.size()) +
                                ") must match number of assets (" +
                                std::to_string(table.cols()) + ")");
    }

    const Eigen::MatrixXd asset_returns = compute_asset_returns(table);
    const Eigen::Map<const Eigen::VectorXd> w(weights.data(),
                                              static_cast<Eigen::Index>(weights.size()));
    const Eigen::VectorXd weighted = asset_returns * w;

    ReturnSeries series;
    series.values.assign(weighted.data(), weighted.data() + weighted.size());
    if (!series.values.empty()) {
        series.dates.assign(table.dates.begin() + 1, table.dates.end());
    }
    return series;
}

} // namespace pvar
