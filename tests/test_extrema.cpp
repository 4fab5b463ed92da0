#include <catch2/catch_test_macros.hpp>

#include <streamfuse/extrema.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>
#include <vector>

TEST_CASE("Extrema of a small sequence", "[extrema]") {
    streamfuse::Extrema<double> e;
    for (double y : {1.0, 2.0, 3.0, 4.0}) e.absorb(y);
    REQUIRE(e.count() == 4);
    REQUIRE(e.value() == std::make_pair(1.0, 4.0));
}

TEST_CASE("Extrema sentinel before any observation", "[extrema]") {
    streamfuse::Extrema<double> e;
    REQUIRE(std::isinf(e.min()));
    REQUIRE(e.min() > 0.0);
    REQUIRE(std::isinf(e.max()));
    REQUIRE(e.max() < 0.0);
}

TEST_CASE("Extrema matches min/max on random data", "[extrema]") {
    std::mt19937 rng(12345);
    std::normal_distribution<double> dist(0.0, 100.0);

    for (int trial = 0; trial < 200; ++trial) {
        const int n = 1 + (trial % 250);
        std::vector<double> xs(n);
        for (double& x : xs) x = dist(rng);

        streamfuse::Extrema<double> e;
        for (double x : xs) e.absorb(x);

        REQUIRE(e.min() == *std::min_element(xs.begin(), xs.end()));
        REQUIRE(e.max() == *std::max_element(xs.begin(), xs.end()));

        const int split = n / 3;
        streamfuse::Extrema<double> a, b;
        for (int i = 0; i < split; ++i) a.absorb(xs[i]);
        for (int i = split; i < n; ++i) b.absorb(xs[i]);
        a.merge(b);
        REQUIRE(a.count() == e.count());
        REQUIRE(a.value() == e.value());
    }
}
