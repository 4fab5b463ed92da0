#pragma once

#include <cmath>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#include <Eigen/Cholesky>
#include <Eigen/Dense>

#include <streamfuse/cov_matrix.hpp>
#include <streamfuse/mean.hpp>
#include <streamfuse/smooth.hpp>
#include <streamfuse/weight.hpp>

namespace streamfuse {

template <typename T = double>
struct MultinomialParams {
    std::size_t trials;
    Vector<T> p;
};

template <typename T = double>
struct MvNormalParams {
    Vector<T> mean;
    Matrix<T> cov;
};

/**
 * @brief Multinomial(trials, p) from a stream of count vectors.
 *
 * `p` is the normalized mean count vector; `trials` is the mean number of
 * trials per observation, rounded. Before the first observation (or while all
 * counts are zero) the default is one trial with uniform `p`.
 */
template <typename T = double>
class FitMultinomial {
public:
    explicit FitMultinomial(std::size_t dim, Weight<T> weight = {})
        : mean_(dim, std::move(weight)) {}

    template <class Derived>
    void absorb(const Eigen::MatrixBase<Derived>& counts) { mean_.absorb(counts); }

    void absorb(const std::vector<T>& counts) {
        mean_.absorb(Eigen::Map<const Vector<T>>(counts.data(),
                                                 static_cast<Eigen::Index>(counts.size())));
    }

    void merge(const FitMultinomial& other) { mean_.merge(other.mean_); }
    void merge(const FitMultinomial& other, T gamma) { mean_.merge(other.mean_, gamma); }

    [[nodiscard]] MultinomialParams<T> value() const {
        const Vector<T>& m = mean_.value();
        const T total = m.sum();
        if (mean_.count() == 0 || !(total > T{0})) {
            return {1, Vector<T>::Constant(m.size(), T{1} / static_cast<T>(m.size()))};
        }
        return {static_cast<std::size_t>(std::llround(total)), m / total};
    }

    [[nodiscard]] std::size_t dim() const noexcept { return mean_.dim(); }
    [[nodiscard]] std::size_t count() const noexcept { return mean_.count(); }

private:
    MeanVector<T> mean_;
};

/**
 * @brief Multivariate normal (mean, covariance) by maximum likelihood.
 *
 * Falls back to `(zeros, identity)` while the covariance estimate is not
 * positive definite, which includes the first observation.
 */
template <typename T = double>
class FitMvNormal {
public:
    explicit FitMvNormal(std::size_t dim, Weight<T> weight = {}) : cov_(dim, std::move(weight)) {}

    template <class Derived>
    void absorb(const Eigen::MatrixBase<Derived>& x) { cov_.absorb(x); }

    void absorb(const std::vector<T>& x) { cov_.absorb(x); }

    void merge(const FitMvNormal& other) { cov_.merge(other.cov_); }
    void merge(const FitMvNormal& other, T gamma) { cov_.merge(other.cov_, gamma); }

    [[nodiscard]] MvNormalParams<T> value() const {
        const auto d = static_cast<Eigen::Index>(dim());
        if (cov_.count() > 1) {
            Matrix<T> c = cov_.value();
            Eigen::LLT<Matrix<T>> llt(c);
            if (llt.info() == Eigen::Success) return {cov_.mean(), std::move(c)};
        }
        return {Vector<T>::Zero(d), Matrix<T>::Identity(d, d)};
    }

    [[nodiscard]] std::size_t dim() const noexcept { return cov_.dim(); }
    [[nodiscard]] std::size_t count() const noexcept { return cov_.count(); }
    [[nodiscard]] const CovMatrix<T>& covariance() const noexcept { return cov_; }

private:
    CovMatrix<T> cov_;
};

}  // namespace streamfuse
