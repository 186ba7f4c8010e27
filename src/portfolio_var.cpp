#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include <pvar/price_table.hpp>
#include <pvar/utils.hpp>
#include <pvar/var_report.hpp>
#include <pvar/weights.hpp>

namespace {

std::string describe(const pvar::RiskEstimate& estimate, double portfolio_value) {
    if (!estimate.has_data) {
        return "n/a (insufficient data)";
    }
    return fmt::format("{:.2f} ({:+.4f}%)", estimate.amount(portfolio_value), estimate.pct * 100.0);
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"portfolio_var"};

    std::string prices_path;
    std::string weights_text;
    std::string tickers_text;
    std::size_t window = 20;
    double confidence = 95.0;
    double portfolio_value = 100000.0;
    std::string log_level = "info";

    app.add_option("-p,--prices", prices_path, "Price CSV path (date,<ticker>,...)")->required();
    app.add_option("-w,--weights", weights_text, "Weights in percent, comma separated (e.g. 50,30,20)")
        ->required();
    app.add_option("-t,--tickers", tickers_text, "Comma separated tickers to select from the price CSV");
    app.add_option("--window", window, "Rolling window in days")
        ->default_val(window)
        ->check(CLI::Range(5, 60));
    app.add_option("-c,--confidence", confidence, "Confidence level in percent")
        ->default_val(confidence)
        ->check(CLI::Range(0.0, 100.0));
    app.add_option("--portfolio-value", portfolio_value, "Portfolio notional")
        ->default_val(portfolio_value)
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", log_level, "spdlog level")
        ->default_val(log_level)
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    try {
        CLI11_PARSE(app, argc, argv);

        spdlog::set_level(spdlog::level::from_str(log_level));

        pvar::PriceTable table;
        if (!pvar::load_price_table_csv(prices_path, table)) {
            return 1;
        }
        spdlog::info("Loaded prices from '{}' with {} rows and {} tickers.",
                     prices_path,
                     table.rows(),
                     table.cols());

        if (!tickers_text.empty()) {
            table = pvar::select_columns(table, pvar::split_fields(tickers_text));
            spdlog::info("Selected {} tickers: {}.", table.cols(), fmt::join(table.tickers, ", "));
        }

        const std::vector<double> weights =
            pvar::normalize_weights(pvar::parse_weights(weights_text));

        pvar::VarConfig config;
        config.window = window;
        config.confidence = confidence;
        config.portfolio_value = portfolio_value;

        const pvar::VarReport report = pvar::compute_var_report(table, weights, config);
        spdlog::debug("Computed {} daily and {} rolling returns.",
                      report.daily.size(),
                      report.rolling.size());

        if (report.rolling.empty()) {
            spdlog::warn("Only {} daily returns for a {}-day window; historical and conditional VaR "
                         "are unavailable.",
                         report.daily.size(),
                         window);
        }

        spdlog::info("==================== Historical ====================");
        spdlog::info("{}% {}-day HVaR: {}",
                     confidence,
                     window,
                     describe(report.historical, portfolio_value));

        spdlog::info("==================== Parametric ====================");
        spdlog::info("{}% {}-day normal VaR: {}",
                     confidence,
                     window,
                     describe(report.parametric, portfolio_value));

        spdlog::info("==================== Conditional ====================");
        spdlog::info("{}% {}-day CVaR (ES): {}",
                     confidence,
                     window,
                     describe(report.conditional, portfolio_value));
    } catch (const CLI::ParseError& parse_error) {
        return app.exit(parse_error);
    } catch (const std::exception& ex) {
        spdlog::error("Failed to compute risk metrics: {}", ex.what());
        return 1;
    }

    return 0;
}
