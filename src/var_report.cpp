#include <pvar/var_report.hpp>

#include <cmath>
#include <stdexcept>

#include <pvar/hvar.hpp>
#include <pvar/parametric.hpp>
#include <pvar/rolling.hpp>
#include <pvar/utils.hpp>

namespace pvar {

double RiskEstimate::amount(double portfolio_value) const {
    return round_to_cents(pct * portfolio_value);
}

VarReport compute_var_report(const PriceTable& table,
                             const std::vector<double>& weights,
                             const VarConfig& config) {
    if (config.window == 0) {
        throw std::invalid_argument("rolling window must be at least one day");
    }
    tail_probability(config.confidence); // throws UnsupportedConfidenceLevel
    if (!(std::isfinite(config.portfolio_value) && config.portfolio_value > 0.0)) {
        throw std::invalid_argument("portfolio value must be positive");
    }

    VarReport report;
    report.daily = compute_portfolio_returns(table, weights);
    report.rolling = compound_rolling(report.daily, config.window);

    auto make_estimate = [&](double pct, bool has_data) {
        RiskEstimate estimate;
        estimate.pct = pct;
        estimate.confidence = config.confidence;
        estimate.window = config.window;
        estimate.has_data = has_data;
        return estimate;
    };

    const bool rolling_ok = !report.rolling.empty();
    report.historical = make_estimate(historical_var(report.rolling.values, config.confidence),
                                      rolling_ok);
    report.conditional = make_estimate(conditional_var(report.rolling.values, config.confidence),
                                       rolling_ok);
    report.parametric = make_estimate(
        parametric_var(report.daily.values, config.confidence, config.window),
        report.daily.size() >= 2);
    return report;
}

} // namespace pvar
