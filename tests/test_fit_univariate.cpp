#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <streamfuse/fit_univariate.hpp>

#include <cmath>
#include <random>

TEST_CASE("Fitters report defaults before two observations", "[fit]") {
    streamfuse::FitBeta<double> beta;
    streamfuse::FitGamma<double> gamma;
    streamfuse::FitNormal<double> normal;
    streamfuse::FitLogNormal<double> lognormal;
    streamfuse::FitCauchy<double> cauchy;

    beta.absorb(0.3);
    gamma.absorb(2.0);
    normal.absorb(5.0);
    lognormal.absorb(5.0);
    cauchy.absorb(5.0);

    REQUIRE(beta.value().alpha == 1.0);
    REQUIRE(beta.value().beta == 1.0);
    REQUIRE(gamma.value().shape == 1.0);
    REQUIRE(gamma.value().scale == 1.0);
    REQUIRE(normal.value().mean == 0.0);
    REQUIRE(normal.value().stddev == 1.0);
    REQUIRE(lognormal.value().meanlog == 0.0);
    REQUIRE(lognormal.value().sdlog == 1.0);
    REQUIRE(cauchy.value().location == 0.0);
    REQUIRE(cauchy.value().scale == 1.0);
}

TEST_CASE("FitNormal recovers mean and standard deviation", "[fit]") {
    std::mt19937 rng(1);
    std::normal_distribution<double> dist(-3.0, 4.0);
    streamfuse::FitNormal<double> a, b;
    for (int i = 0; i < 100000; ++i) (i < 30000 ? a : b).absorb(dist(rng));
    a.merge(b);

    REQUIRE(a.count() == 100000);
    REQUIRE(a.value().mean == Catch::Approx(-3.0).margin(0.05));
    REQUIRE(a.value().stddev == Catch::Approx(4.0).margin(0.05));
}

TEST_CASE("FitBeta by method of moments", "[fit]") {
    std::mt19937 rng(2);
    std::gamma_distribution<double> ga(3.0, 1.0), gb(5.0, 1.0);
    streamfuse::FitBeta<double> fit;
    for (int i = 0; i < 200000; ++i) {
        const double x = ga(rng);
        const double y = gb(rng);
        fit.absorb(x / (x + y));
    }
    REQUIRE(fit.value().alpha == Catch::Approx(3.0).margin(0.2));
    REQUIRE(fit.value().beta == Catch::Approx(5.0).margin(0.3));
}

TEST_CASE("FitGamma by method of moments", "[fit]") {
    std::mt19937 rng(3);
    std::gamma_distribution<double> dist(5.0, 2.0);
    streamfuse::FitGamma<double> fit;
    for (int i = 0; i < 200000; ++i) fit.absorb(dist(rng));
    REQUIRE(fit.value().shape == Catch::Approx(5.0).margin(0.2));
    REQUIRE(fit.value().scale == Catch::Approx(2.0).margin(0.1));
}

TEST_CASE("FitLogNormal fits the log scale", "[fit]") {
    std::mt19937 rng(4);
    std::lognormal_distribution<double> dist(3.0, 0.5);
    streamfuse::FitLogNormal<double> fit;
    for (int i = 0; i < 100000; ++i) fit.absorb(dist(rng));
    REQUIRE(fit.value().meanlog == Catch::Approx(3.0).margin(0.02));
    REQUIRE(fit.value().sdlog == Catch::Approx(0.5).margin(0.02));

    REQUIRE_THROWS_AS(fit.absorb(0.0), streamfuse::InvalidParameter);
    REQUIRE_THROWS_AS(fit.absorb(-1.0), streamfuse::InvalidParameter);
    REQUIRE(fit.count() == 100000);
}

TEST_CASE("FitCauchy from quantiles", "[fit]") {
    std::mt19937 rng(5);
    std::cauchy_distribution<double> dist(0.0, 10.0);
    streamfuse::FitCauchy<double> fit;
    for (int i = 0; i < 100000; ++i) fit.absorb(dist(rng));
    REQUIRE(fit.value().location == Catch::Approx(0.0).margin(1.0));
    REQUIRE(fit.value().scale == Catch::Approx(10.0).margin(1.0));
}
