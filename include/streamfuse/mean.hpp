#pragma once

#include <cstddef>
#include <limits>
#include <type_traits>
#include <utility>

#include <streamfuse/error.hpp>
#include <streamfuse/smooth.hpp>
#include <streamfuse/weight.hpp>

namespace streamfuse {

/// Univariate running mean.
template <typename T = double>
class Mean {
    static_assert(std::is_floating_point_v<T>, "Mean requires floating point T");

public:
    explicit Mean(Weight<T> weight = {}) : weight_(std::move(weight)) {}

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        const T gamma = policy.advance();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        mean_ = smooth(mean_, y, gamma);
    }

    void merge(const Mean& other) { merge(other, merge_coefficient<T>(n_, other.n_)); }

    void merge(const Mean& other, T gamma) {
        if (other.n_ == 0) return;
        mean_ = smooth(mean_, other.mean_, gamma);
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }

    // NaN before the first observation.
    [[nodiscard]] constexpr T value() const noexcept {
        if (n_ < 1) return std::numeric_limits<T>::quiet_NaN();
        return mean_;
    }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        mean_ = T{0};
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    T mean_{0};
};

/**
 * @brief Elementwise running mean of fixed-length vectors.
 *
 * The dimension is fixed at construction; absorbing or merging a vector of a
 * different length throws `ShapeMismatch`.
 */
template <typename T = double>
class MeanVector {
    static_assert(std::is_floating_point_v<T>, "MeanVector requires floating point T");

public:
    explicit MeanVector(std::size_t dim, Weight<T> weight = {})
        : weight_(std::move(weight)), mean_(Vector<T>::Zero(checked_dim(dim))) {}

    template <class Derived>
    void absorb(const Eigen::MatrixBase<Derived>& x) { absorb(x, weight_); }

    template <class Derived>
    void absorb(const Eigen::MatrixBase<Derived>& x, Weight<T>& policy) {
        validate_same_size(dim(), static_cast<std::size_t>(x.size()), "MeanVector::absorb");
        const T gamma = policy.advance();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        smooth_vec(mean_, x, gamma);
    }

    void merge(const MeanVector& other) {
        merge(other, merge_coefficient<T>(n_, other.n_));
    }

    void merge(const MeanVector& other, T gamma) {
        validate_same_size(dim(), other.dim(), "MeanVector::merge");
        if (other.n_ == 0) return;
        smooth_vec(mean_, other.mean_, gamma);
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] std::size_t dim() const noexcept {
        return static_cast<std::size_t>(mean_.size());
    }
    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] const Vector<T>& value() const noexcept { return mean_; }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        mean_.setZero();
        weight_.reset();
    }

private:
    static Eigen::Index checked_dim(std::size_t dim) {
        validate_positive(dim, "MeanVector dimension");
        return static_cast<Eigen::Index>(dim);
    }

    Weight<T> weight_;
    std::size_t n_{0};
    Vector<T> mean_;
};

}  // namespace streamfuse
