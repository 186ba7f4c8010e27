#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pvar {

struct PriceTable {
    std::vector<std::string> dates;   // ISO yyyy-mm-dd, strictly increasing
    std::vector<std::string> tickers;
    std::vector<double> closes;       // row-major: dates x tickers

    [[nodiscard]] std::size_t rows() const noexcept;
    [[nodiscard]] std::size_t cols() const noexcept;
    [[nodiscard]] double at(std::size_t row, std::size_t col) const;
};

bool load_price_table_csv(const std::string& path, PriceTable& table);

// Restricts the table to the given tickers, in the given order. Tickers are
// matched case-insensitively after trimming. An empty list returns a copy.
PriceTable select_columns(const PriceTable& table, const std::vector<std::string>& tickers);

} // namespace pvar
