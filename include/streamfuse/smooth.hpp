#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include <streamfuse/error.hpp>

namespace streamfuse {

template <typename T>
using Vector = Eigen::Matrix<T, Eigen::Dynamic, 1>;

template <typename T>
using Matrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

// --- Smoothing kernels -------------------------------------------------------
//
// All kernels compute the convex combination `(1 - gamma) * old + gamma * x`.
// Written in that form (rather than `old + gamma * (x - old)`) so gamma == 1
// reproduces `x` exactly.

template <typename T>
[[nodiscard]] constexpr T smooth(T old, T x, T gamma) noexcept {
    return (T{1} - gamma) * old + gamma * x;
}

template <typename T>
void smooth_vec(std::vector<T>& old, const std::vector<T>& x, T gamma) {
    validate_same_size(old.size(), x.size(), "smooth_vec");
    const T keep = T{1} - gamma;
    for (std::size_t i = 0; i < old.size(); ++i) {
        old[i] = keep * old[i] + gamma * x[i];
    }
}

template <typename T, class Derived>
void smooth_vec(Vector<T>& old, const Eigen::MatrixBase<Derived>& x, T gamma) {
    validate_same_size(static_cast<std::size_t>(old.size()),
                       static_cast<std::size_t>(x.size()), "smooth_vec");
    old = (T{1} - gamma) * old + gamma * x;
}

/// Elementwise smoothing of two matrices of the same shape.
template <typename T, class Derived>
void smooth_mat(Matrix<T>& old, const Eigen::MatrixBase<Derived>& x, T gamma) {
    if (old.rows() != x.rows() || old.cols() != x.cols()) {
        throw ShapeMismatch("smooth_mat: expected " + std::to_string(old.rows()) + "x"
                            + std::to_string(old.cols()) + ", found "
                            + std::to_string(x.rows()) + "x" + std::to_string(x.cols()));
    }
    old = (T{1} - gamma) * old + gamma * x;
}

/**
 * @brief Symmetric rank-1 smoothing `A <- (1 - gamma) * A + gamma * x x'`.
 *
 * Only the upper triangle of `A` is maintained; read it back through
 * `A.template selfadjointView<Eigen::Upper>()`.
 */
template <typename T, class Derived>
void smooth_rank1(Matrix<T>& a, const Eigen::MatrixBase<Derived>& x, T gamma) {
    validate_same_size(static_cast<std::size_t>(a.rows()),
                       static_cast<std::size_t>(x.size()), "smooth_rank1");
    a.template triangularView<Eigen::Upper>() *= (T{1} - gamma);
    a.template selfadjointView<Eigen::Upper>().rankUpdate(x, gamma);
}

}  // namespace streamfuse
