#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using Catch::Approx;

#include <pvar/price_table.hpp>

namespace {

std::filesystem::path write_csv(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST_CASE("load_price_table_csv reads a date-indexed close table") {
    const auto path = write_csv("pvar_prices_ok.csv",
                                "date,reliance,INFY\n"
                                "2024-01-02,100,50\n"
                                "2024-01-03,101,49\n"
                                "\n"
                                "2024-01-04,102,51\n");

    pvar::PriceTable table;
    REQUIRE(pvar::load_price_table_csv(path.string(), table));

    REQUIRE(table.rows() == 3);
    REQUIRE(table.cols() == 2);
    REQUIRE(table.tickers[0] == "RELIANCE");
    REQUIRE(table.tickers[1] == "INFY");
    REQUIRE(table.dates.back() == "2024-01-04");
    REQUIRE(table.at(1, 0) == Approx(101.0));
    REQUIRE(table.at(2, 1) == Approx(51.0));
    REQUIRE_THROWS_AS(table.at(3, 0), std::out_of_range);

    std::filesystem::remove(path);
}

TEST_CASE("load_price_table_csv rejects malformed tables") {
    pvar::PriceTable table;

    SECTION("missing file") {
        REQUIRE_FALSE(pvar::load_price_table_csv("/nonexistent/pvar_prices.csv", table));
    }
    SECTION("dates out of order") {
        const auto path = write_csv("pvar_prices_order.csv",
                                    "date,A\n2024-01-03,100\n2024-01-02,101\n");
        REQUIRE_FALSE(pvar::load_price_table_csv(path.string(), table));
        std::filesystem::remove(path);
    }
    SECTION("invalid calendar date") {
        const auto path = write_csv("pvar_prices_date.csv", "date,A\n2024-02-30,100\n");
        REQUIRE_FALSE(pvar::load_price_table_csv(path.string(), table));
        std::filesystem::remove(path);
    }
    SECTION("non-positive close") {
        const auto path = write_csv("pvar_prices_zero.csv",
                                    "date,A\n2024-01-02,100\n2024-01-03,0\n");
        REQUIRE_FALSE(pvar::load_price_table_csv(path.string(), table));
        std::filesystem::remove(path);
    }
    SECTION("ragged row") {
        const auto path = write_csv("pvar_prices_ragged.csv",
                                    "date,A,B\n2024-01-02,100\n");
        REQUIRE_FALSE(pvar::load_price_table_csv(path.string(), table));
        std::filesystem::remove(path);
    }
    SECTION("header only") {
        const auto path = write_csv("pvar_prices_empty.csv", "date,A,B\n");
        REQUIRE_FALSE(pvar::load_price_table_csv(path.string(), table));
        std::filesystem::remove(path);
    }

    REQUIRE(table.rows() == 0);
}

TEST_CASE("select_columns reorders and restricts by ticker") {
    pvar::PriceTable table;
    table.dates = {"2024-01-02", "2024-01-03"};
    table.tickers = {"RELIANCE", "INFY", "TCS"};
    table.closes = {100.0, 50.0, 3000.0,
                    101.0, 49.0, 3010.0};

    const auto selected = pvar::select_columns(table, {" tcs", "Reliance"});

    REQUIRE(selected.cols() == 2);
    REQUIRE(selected.rows() == 2);
    REQUIRE(selected.tickers[0] == "TCS");
    REQUIRE(selected.tickers[1] == "RELIANCE");
    REQUIRE(selected.at(1, 0) == Approx(3010.0));
    REQUIRE(selected.at(1, 1) == Approx(101.0));

    REQUIRE(pvar::select_columns(table, {}).cols() == 3);
    REQUIRE_THROWS_AS(pvar::select_columns(table, {"WIPRO"}), std::invalid_argument);
    REQUIRE_THROWS_AS(pvar::select_columns(table, {"TCS", "tcs"}), std::invalid_argument);
}
