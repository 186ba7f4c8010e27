#include <pvar/price_table.hpp>

#include <pvar/utils.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pvar {

namespace {

bool parse_double(const std::string& token, double& value) {
    if (token.empty()) {
        return false;
    }
    try {
        size_t idx = 0;
        value = std::stod(token, &idx);
        if (idx != token.size() || !std::isfinite(value)) {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

std::optional<std::chrono::sys_days> parse_iso_date(std::string_view token) {
    if (token.size() != 10 || token[4] != '-' || token[7] != '-') {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) {
            return std::nullopt;
        }
    }
    auto digits = [&](std::size_t pos, std::size_t len) {
        int value = 0;
        for (std::size_t i = pos; i < pos + len; ++i) {
            value = value * 10 + (token[i] - '0');
        }
        return value;
    };

    using namespace std::chrono;
    const year_month_day ymd{year{digits(0, 4)},
                             month{static_cast<unsigned>(digits(5, 2))},
                             day{static_cast<unsigned>(digits(8, 2))}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return sys_days{ymd};
}

std::string normalize_ticker(std::string_view ticker) {
    std::string out = trim(ticker);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

} // namespace

std::size_t PriceTable::rows() const noexcept {
    return dates.size();
}

std::size_t PriceTable::cols() const noexcept {
    return tickers.size();
}

double PriceTable::at(std::size_t row, std::size_t col) const {
    if (row >= rows() || col >= cols()) {
        throw std::out_of_range("price table index out of range");
    }
    return closes.at(row * cols() + col);
}

bool load_price_table_csv(const std::string& path, PriceTable& table) {
    table = PriceTable{};

    std::ifstream input(path);
    if (!input.is_open()) {
        spdlog::error("Failed to open price CSV: {}", path);
        return false;
    }

    std::string line;
    if (!std::getline(input, line)) {
        spdlog::error("Price CSV missing header row");
        return false;
    }

    const auto header = split_fields(line);
    if (header.size() < 2) {
        spdlog::error("Price CSV header needs a date column and at least one ticker");
        return false;
    }
    if (header.front() != "date") {
        spdlog::error("First header column must be 'date'");
        return false;
    }

    std::vector<std::string> tickers;
    tickers.reserve(header.size() - 1);
    for (std::size_t i = 1; i < header.size(); ++i) {
        if (header[i].empty()) {
            spdlog::error("Empty ticker symbol at header column {}", i);
            return false;
        }
        const std::string ticker = normalize_ticker(header[i]);
        if (std::find(tickers.begin(), tickers.end(), ticker) != tickers.end()) {
            spdlog::error("Duplicate ticker '{}' in price CSV header", ticker);
            return false;
        }
        tickers.push_back(ticker);
    }
    const std::size_t N = tickers.size();

    std::vector<std::string> dates;
    std::vector<double> closes;
    std::optional<std::chrono::sys_days> previous;
    std::size_t row_index = 1;
    while (std::getline(input, line)) {
        ++row_index;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }
        const auto fields = split_fields(line);
        if (fields.size() != N + 1) {
            spdlog::error("Unexpected field count in price row {}", row_index);
            return false;
        }

        const auto date = parse_iso_date(fields.front());
        if (!date) {
            spdlog::error("Invalid date '{}' in price row {}", fields.front(), row_index);
            return false;
        }
        if (previous && *date <= *previous) {
            spdlog::error("Dates must be strictly increasing (row {})", row_index);
            return false;
        }
        previous = date;

        dates.push_back(fields.front());
        for (std::size_t i = 0; i < N; ++i) {
            double value = 0.0;
            if (!parse_double(fields[i + 1], value) || value <= 0.0) {
                spdlog::error("Invalid close for ticker '{}' in price row {}", tickers[i], row_index);
                return false;
            }
            closes.push_back(value);
        }
    }

    if (dates.empty()) {
        spdlog::error("No data rows found in price CSV");
        return false;
    }

    table.dates = std::move(dates);
    table.tickers = std::move(tickers);
    table.closes = std::move(closes);
    return true;
}

PriceTable select_columns(const PriceTable& table, const std::vector<std::string>& tickers) {
    if (tickers.empty()) {
        return table;
    }

    std::vector<std::size_t> source_columns;
    source_columns.reserve(tickers.size());
    PriceTable out;
    out.dates = table.dates;
    for (const auto& requested : tickers) {
        const std::string ticker = normalize_ticker(requested);
        if (std::find(out.tickers.begin(), out.tickers.end(), ticker) != out.tickers.end()) {
            throw std::invalid_argument("ticker '" + ticker + "' requested more than once");
        }
        std::optional<std::size_t> found;
        for (std::size_t i = 0; i < table.cols(); ++i) {
            if (normalize_ticker(table.tickers[i]) == ticker) {
                found = i;
                break;
            }
        }
        if (!found) {
            throw std::invalid_argument("ticker '" + ticker + "' not present in price table");
        }
        source_columns.push_back(*found);
        out.tickers.push_back(table.tickers[*found]);
    }

    out.closes.reserve(table.rows() * source_columns.size());
    for (std::size_t t = 0; t < table.rows(); ++t) {
        for (std::size_t col : source_columns) {
            out.closes.push_back(table.at(t, col));
        }
    }
    return out;
}

} // namespace pvar
