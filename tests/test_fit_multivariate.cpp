#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <streamfuse/fit_multivariate.hpp>

#include <Eigen/Dense>

#include <random>
#include <vector>

TEST_CASE("FitMultinomial from count vectors", "[fit][multinomial]") {
    streamfuse::FitMultinomial<double> fit(3);
    REQUIRE(fit.value().trials == 1);
    REQUIRE(fit.value().p(0) == Catch::Approx(1.0 / 3.0));

    fit.absorb(std::vector<double>{1.0, 2.0, 7.0});
    fit.absorb(Eigen::Vector3d(3.0, 3.0, 4.0));

    const auto params = fit.value();
    REQUIRE(params.trials == 10);
    REQUIRE(params.p(0) == Catch::Approx(0.2));
    REQUIRE(params.p(1) == Catch::Approx(0.25));
    REQUIRE(params.p(2) == Catch::Approx(0.55));

    REQUIRE_THROWS_AS(fit.absorb(std::vector<double>{1.0, 2.0}), streamfuse::ShapeMismatch);
}

TEST_CASE("FitMvNormal", "[fit][mvnormal]") {
    streamfuse::FitMvNormal<double> fit(2);
    fit.absorb(Eigen::Vector2d(1.0, 1.0));
    auto params = fit.value();
    REQUIRE(params.mean.isZero());
    REQUIRE(params.cov.isIdentity());

    // constant data never yields a positive definite estimate
    fit.absorb(Eigen::Vector2d(1.0, 1.0));
    REQUIRE(fit.value().cov.isIdentity());

    Eigen::Matrix2d sigma;
    sigma << 2.0, 0.5,
             0.5, 1.0;
    const Eigen::Matrix2d chol = sigma.llt().matrixL();
    std::mt19937 rng(6);
    std::normal_distribution<double> z(0.0, 1.0);
    streamfuse::FitMvNormal<double> a(2), b(2);
    for (int i = 0; i < 100000; ++i) {
        const Eigen::Vector2d x = Eigen::Vector2d(4.0, -1.0) + chol * Eigen::Vector2d(z(rng), z(rng));
        (i % 3 == 0 ? a : b).absorb(x);
    }
    a.merge(b);
    params = a.value();
    REQUIRE(params.mean(0) == Catch::Approx(4.0).margin(0.03));
    REQUIRE(params.mean(1) == Catch::Approx(-1.0).margin(0.03));
    REQUIRE(params.cov(0, 0) == Catch::Approx(2.0).margin(0.05));
    REQUIRE(params.cov(0, 1) == Catch::Approx(0.5).margin(0.05));
    REQUIRE(params.cov(1, 1) == Catch::Approx(1.0).margin(0.05));
}
