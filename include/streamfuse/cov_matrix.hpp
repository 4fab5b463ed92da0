#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <streamfuse/error.hpp>
#include <streamfuse/smooth.hpp>
#include <streamfuse/weight.hpp>

namespace streamfuse {

/**
 * @brief Covariance matrix of `dim` variables from a stream of vectors.
 *
 * Keeps the column means `b = E[x]` and the raw second-moment matrix
 * `A = E[x x']` (upper triangle only). Both are raw moments, so merging is an
 * elementwise smooth with no mean-shift term. `value()` recomputes
 * `(A - b b') * bias_correction` on every call and never touches the stored
 * statistics.
 */
template <typename T = double>
class CovMatrix {
    static_assert(std::is_floating_point_v<T>, "CovMatrix requires floating point T");

public:
    explicit CovMatrix(std::size_t dim, Weight<T> weight = {})
        : weight_(std::move(weight)),
          a_(Matrix<T>::Zero(checked_dim(dim), checked_dim(dim))),
          b_(Vector<T>::Zero(checked_dim(dim))) {}

    // --- Observe -------------------------------------------------------------

    template <class Derived>
    void absorb(const Eigen::MatrixBase<Derived>& x) { absorb(x, weight_); }

    template <class Derived>
    void absorb(const Eigen::MatrixBase<Derived>& x, Weight<T>& policy) {
        validate_same_size(dim(), static_cast<std::size_t>(x.size()), "CovMatrix::absorb");
        const T gamma = policy.advance();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        smooth_vec(b_, x, gamma);
        smooth_rank1(a_, x, gamma);
    }

    void absorb(const std::vector<T>& x) {
        absorb(Eigen::Map<const Vector<T>>(x.data(), static_cast<Eigen::Index>(x.size())));
    }

    // --- Merge ---------------------------------------------------------------

    void merge(const CovMatrix& other) {
        merge(other, merge_coefficient<T>(n_, other.n_));
    }

    void merge(const CovMatrix& other, T gamma) {
        validate_same_size(dim(), other.dim(), "CovMatrix::merge");
        if (other.n_ == 0) return;
        smooth_mat(a_, other.a_, gamma);
        smooth_vec(b_, other.b_, gamma);
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    // --- Accessors -----------------------------------------------------------

    [[nodiscard]] std::size_t dim() const noexcept {
        return static_cast<std::size_t>(b_.size());
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }

    [[nodiscard]] Vector<T> mean() const {
        if (n_ < 1) return Vector<T>::Constant(b_.size(), std::numeric_limits<T>::quiet_NaN());
        return b_;
    }

    // Bias-corrected covariance; all NaN until two observations are in.
    [[nodiscard]] Matrix<T> value() const {
        const auto d = b_.size();
        if (n_ < 2) return Matrix<T>::Constant(d, d, std::numeric_limits<T>::quiet_NaN());
        Matrix<T> c = a_.template selfadjointView<Eigen::Upper>();
        c.noalias() -= b_ * b_.transpose();
        c *= weight_.bias_correction(n_);
        return c;
    }

    [[nodiscard]] Matrix<T> cov() const { return value(); }

    [[nodiscard]] Vector<T> var() const { return value().diagonal(); }

    [[nodiscard]] Vector<T> stddev() const { return var().cwiseSqrt(); }

    // Unit diagonal by construction; off-diagonals are NaN for constant variables.
    [[nodiscard]] Matrix<T> cor() const {
        const Matrix<T> c = value();
        const Vector<T> inv_std = c.diagonal().cwiseSqrt().cwiseInverse();
        Matrix<T> r = inv_std.asDiagonal() * c * inv_std.asDiagonal();
        r.diagonal().setOnes();
        return r;
    }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    // --- Reset ---------------------------------------------------------------

    void reset() noexcept {
        n_ = 0;
        a_.setZero();
        b_.setZero();
        weight_.reset();
    }

private:
    static Eigen::Index checked_dim(std::size_t dim) {
        validate_positive(dim, "CovMatrix dimension");
        return static_cast<Eigen::Index>(dim);
    }

    Weight<T> weight_;
    std::size_t n_{0};
    Matrix<T> a_;  // E[x x'], upper triangle
    Vector<T> b_;  // E[x]
};

}  // namespace streamfuse
