#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <type_traits>
#include <utility>

#include <streamfuse/smooth.hpp>
#include <streamfuse/weight.hpp>

namespace streamfuse {

template <typename T = double>
class Variance {
    static_assert(std::is_floating_point_v<T>, "Variance requires floating point T");

public:
    explicit Variance(Weight<T> weight = {}) : weight_(std::move(weight)) {}

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        const T gamma = policy.advance();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        const T mean_prev = mean_;
        mean_ = smooth(mean_, y, gamma);
        var_ = smooth(var_, (y - mean_) * (y - mean_prev), gamma);
    }

    // Merge another accumulator into this one (parallel-friendly).
    void merge(const Variance& other) {
        merge(other, merge_coefficient<T>(n_, other.n_));
    }

    void merge(const Variance& other, T gamma) {
        if (other.n_ == 0) return;
        const T delta = other.mean_ - mean_;
        var_ = smooth(var_, other.var_, gamma) + delta * delta * gamma * (T{1} - gamma);
        mean_ = smooth(mean_, other.mean_, gamma);
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }

    [[nodiscard]] constexpr T mean() const noexcept {
        if (n_ < 1) return std::numeric_limits<T>::quiet_NaN();
        return mean_;
    }

    // Bias-corrected; NaN until two observations are in.
    [[nodiscard]] T value() const noexcept {
        if (n_ < 2) return std::numeric_limits<T>::quiet_NaN();
        return var_ * weight_.bias_correction(n_);
    }

    [[nodiscard]] T variance_population() const noexcept {
        if (n_ < 1) return std::numeric_limits<T>::quiet_NaN();
        return var_;
    }

    [[nodiscard]] T stddev() const noexcept { return std::sqrt(value()); }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        mean_ = T{0};
        var_ = T{0};
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    T mean_{0};
    T var_{0};  // biased (population) variance
};

}  // namespace streamfuse
