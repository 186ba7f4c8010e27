#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vector>

using Catch::Approx;

#include <pvar/errors.hpp>
#include <pvar/weights.hpp>

TEST_CASE("parse_weights reads comma separated percentages") {
    const auto weights = pvar::parse_weights("50, 30,20 ");

    REQUIRE(weights.size() == 3);
    REQUIRE(weights[0] == Approx(50.0));
    REQUIRE(weights[1] == Approx(30.0));
    REQUIRE(weights[2] == Approx(20.0));
}

TEST_CASE("parse_weights rejects malformed input") {
    REQUIRE_THROWS_AS(pvar::parse_weights(""), pvar::InvalidWeights);
    REQUIRE_THROWS_AS(pvar::parse_weights("50, abc, 20"), pvar::InvalidWeights);
    REQUIRE_THROWS_AS(pvar::parse_weights("50,,50"), pvar::InvalidWeights);
    REQUIRE_THROWS_AS(pvar::parse_weights("50x, 50"), pvar::InvalidWeights);
    REQUIRE_THROWS_AS(pvar::parse_weights("nan, 100"), pvar::InvalidWeights);
}

TEST_CASE("normalize_weights converts percentages to fractions") {
    const auto fractions = pvar::normalize_weights({60.0, 40.0});

    REQUIRE(fractions.size() == 2);
    REQUIRE(fractions[0] == Approx(0.6));
    REQUIRE(fractions[1] == Approx(0.4));
}

TEST_CASE("normalize_weights tolerates rounding but not a wrong total") {
    REQUIRE_NOTHROW(pvar::normalize_weights({33.3333333, 33.3333333, 33.3333334}));
    REQUIRE_NOTHROW(pvar::normalize_weights({10.1, 20.2, 69.7}));

    REQUIRE_THROWS_AS(pvar::normalize_weights({50.0, 30.0, 10.0}), pvar::InvalidWeights);
    REQUIRE_THROWS_AS(pvar::normalize_weights({}), pvar::InvalidWeights);
}

TEST_CASE("normalize_weights allows short positions") {
    const auto fractions = pvar::normalize_weights({150.0, -50.0});

    REQUIRE(fractions[0] == Approx(1.5));
    REQUIRE(fractions[1] == Approx(-0.5));
}
