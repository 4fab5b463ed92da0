#include <streamfuse/cov_matrix.hpp>
#include <streamfuse/extrema.hpp>
#include <streamfuse/fit_univariate.hpp>
#include <streamfuse/quantile.hpp>
#include <streamfuse/variance.hpp>

#include <Eigen/Dense>
#include <iostream>
#include <random>

int main() {
  std::mt19937 rng(42);
  std::normal_distribution<double> dist(10.0, 2.0);

  // two workers see alternate halves of one stream
  streamfuse::Variance<double> var_a, var_b;
  streamfuse::Extrema<double> ext_a, ext_b;
  streamfuse::QuantileMM<double> q_a, q_b;
  streamfuse::FitNormal<double> fit_a, fit_b;
  streamfuse::CovMatrix<double> cov_a(2), cov_b(2);

  for (int i = 0; i < 10000; ++i) {
    const double y = dist(rng);
    const Eigen::Vector2d x(y, 0.5 * y + dist(rng));
    const bool first = i < 5000;
    (first ? var_a : var_b).absorb(y);
    (first ? ext_a : ext_b).absorb(y);
    (first ? q_a : q_b).absorb(y);
    (first ? fit_a : fit_b).absorb(y);
    (first ? cov_a : cov_b).absorb(x);
  }

  var_a.merge(var_b);
  ext_a.merge(ext_b);
  q_a.merge(q_b);
  fit_a.merge(fit_b);
  cov_a.merge(cov_b);

  const auto [lo, hi] = ext_a.value();
  const auto& q = q_a.value();
  const auto params = fit_a.value();

  std::cout << "n=" << var_a.count()
            << " mean=" << var_a.mean()
            << " var=" << var_a.value()
            << " min=" << lo << " max=" << hi
            << "\n";
  std::cout << "quartiles=" << q[0] << " " << q[1] << " " << q[2] << "\n";
  std::cout << "normal fit: mean=" << params.mean << " sd=" << params.stddev << "\n";
  std::cout << "cor=\n" << cov_a.cor() << "\n";
}
