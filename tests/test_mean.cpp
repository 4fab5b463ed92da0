#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <streamfuse/mean.hpp>

#include <Eigen/Dense>

#include <cmath>
#include <numeric>
#include <random>
#include <vector>

TEST_CASE("Mean of a small sequence", "[mean]") {
    streamfuse::Mean<double> m;
    REQUIRE(std::isnan(m.value()));
    for (double y : {1.0, 2.0, 3.0, 4.0}) m.absorb(y);
    REQUIRE(m.count() == 4);
    REQUIRE(m.value() == Catch::Approx(2.5));
}

TEST_CASE("Mean merge equals absorb-all-at-once", "[mean][merge]") {
    std::mt19937 rng(6789);
    std::uniform_real_distribution<double> dist(-10.0, 10.0);

    for (int trial = 0; trial < 200; ++trial) {
        const int n = 2 + (trial % 300);
        std::vector<double> xs(n);
        for (double& x : xs) x = dist(rng);

        streamfuse::Mean<double> all;
        for (double x : xs) all.absorb(x);

        const int split = (trial * 7) % n;
        streamfuse::Mean<double> a, b;
        for (int i = 0; i < split; ++i) a.absorb(xs[i]);
        for (int i = split; i < n; ++i) b.absorb(xs[i]);
        a.merge(b);

        const double naive = std::accumulate(xs.begin(), xs.end(), 0.0) / n;
        REQUIRE(a.count() == all.count());
        REQUIRE(a.value() == Catch::Approx(all.value()).epsilon(1e-12));
        REQUIRE(all.value() == Catch::Approx(naive).epsilon(1e-12));
    }
}

TEST_CASE("Mean with an explicit merge coefficient", "[mean][merge]") {
    streamfuse::Mean<double> old_window, new_window;
    for (double y : {1.0, 1.0, 1.0}) old_window.absorb(y);
    for (double y : {5.0, 5.0}) new_window.absorb(y);

    old_window.merge(new_window, 1.0);
    REQUIRE(old_window.value() == 5.0);
    REQUIRE(old_window.count() == 5);
}

TEST_CASE("Mean under bounded exponential weighting tracks a level shift", "[mean][weight]") {
    streamfuse::Mean<double> m(streamfuse::BoundedExponentialWeight<double>::from_lookback(19));
    for (int i = 0; i < 100; ++i) m.absorb(0.0);
    for (int i = 0; i < 200; ++i) m.absorb(10.0);
    REQUIRE(m.value() == Catch::Approx(10.0).margin(1e-6));
}

TEST_CASE("MeanVector elementwise mean and merge", "[mean][vector]") {
    streamfuse::MeanVector<double> a(2), b(2);
    a.absorb(Eigen::Vector2d(1.0, 10.0));
    a.absorb(Eigen::Vector2d(3.0, 20.0));
    b.absorb(Eigen::Vector2d(5.0, 30.0));
    b.absorb(Eigen::Vector2d(7.0, 40.0));

    REQUIRE(a.value()(0) == Catch::Approx(2.0));
    a.merge(b);
    REQUIRE(a.count() == 4);
    REQUIRE(a.value()(0) == Catch::Approx(4.0));
    REQUIRE(a.value()(1) == Catch::Approx(25.0));
}

TEST_CASE("MeanVector shape errors", "[mean][vector]") {
    REQUIRE_THROWS_AS(streamfuse::MeanVector<double>(0), streamfuse::InvalidParameter);

    streamfuse::MeanVector<double> a(2), c(3);
    REQUIRE_THROWS_AS(a.absorb(Eigen::Vector3d(1.0, 2.0, 3.0)), streamfuse::ShapeMismatch);
    REQUIRE_THROWS_AS(a.merge(c), streamfuse::ShapeMismatch);
    REQUIRE(a.count() == 0);
}
