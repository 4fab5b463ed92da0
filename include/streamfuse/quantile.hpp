#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <streamfuse/error.hpp>
#include <streamfuse/smooth.hpp>
#include <streamfuse/weight.hpp>

namespace streamfuse {

// --- Pinball loss ------------------------------------------------------------

/// Pinball loss `rho_tau(y - v)`; minimized in `v` by the tau-quantile.
template <typename T>
[[nodiscard]] constexpr T quantile_loss(T tau, T y, T v) noexcept {
    const T r = y - v;
    return r < T{0} ? (tau - T{1}) * r : tau * r;
}

/// Subgradient of `rho_tau(y - v)` with respect to the estimate `v`.
template <typename T>
[[nodiscard]] constexpr T quantile_loss_deriv(T tau, T y, T v) noexcept {
    return y < v ? T{1} - tau : -tau;
}

namespace detail {

template <typename T>
std::vector<T> checked_levels(std::vector<T> taus) {
    if (taus.empty()) throw InvalidParameter("quantile levels must not be empty");
    for (const T tau : taus) validate_open_unit_interval(tau, "quantile level");
    return taus;
}

template <typename T>
void check_same_levels(const std::vector<T>& a, const std::vector<T>& b, const char* what) {
    if (a != b) {
        throw IncompatibleConfig(std::string(what) + ": objects track different quantiles");
    }
}

template <typename T>
std::vector<T> default_levels() {
    return {T{0.25}, T{0.5}, T{0.75}};
}

}  // namespace detail

// --- QuantileSGD -------------------------------------------------------------

/**
 * @brief Quantiles by stochastic subgradient descent on the pinball loss.
 *
 * One estimate per level in `taus`; all share the policy's update counter.
 * Defaults to `LearningRate(0.6)`. Estimates start at zero.
 */
template <typename T = double>
class QuantileSGD {
    static_assert(std::is_floating_point_v<T>, "QuantileSGD requires floating point T");

public:
    explicit QuantileSGD(std::vector<T> taus = detail::default_levels<T>(),
                         Weight<T> weight = LearningRate<T>{})
        : weight_(std::move(weight)),
          taus_(detail::checked_levels(std::move(taus))),
          value_(taus_.size(), T{0}) {}

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        const T gamma = policy.advance();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        for (std::size_t i = 0; i < taus_.size(); ++i) {
            value_[i] -= gamma * quantile_loss_deriv(taus_[i], y, value_[i]);
        }
    }

    void merge(const QuantileSGD& other) {
        merge(other, merge_coefficient<T>(n_, other.n_));
    }

    void merge(const QuantileSGD& other, T gamma) {
        detail::check_same_levels(taus_, other.taus_, "QuantileSGD::merge");
        if (other.n_ == 0) return;
        smooth_vec(value_, other.value_, gamma);
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] const std::vector<T>& taus() const noexcept { return taus_; }
    [[nodiscard]] const std::vector<T>& value() const noexcept { return value_; }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        std::fill(value_.begin(), value_.end(), T{0});
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    std::vector<T> taus_;
    std::vector<T> value_;
};

// --- QuantileISGD ------------------------------------------------------------

/**
 * @brief Quantiles by implicit stochastic gradient descent.
 *
 * Each update approximates the implicit step
 * `v_new = v - gamma * d/dv rho_tau(y - v_new)` with `inner_steps` fixed-point
 * iterations. Iterate `k` is smoothed toward the explicit step taken from the
 * previous iterate with weight `min(1, inner_scale / k)`.
 */
template <typename T = double>
class QuantileISGD {
    static_assert(std::is_floating_point_v<T>, "QuantileISGD requires floating point T");

public:
    explicit QuantileISGD(std::vector<T> taus = detail::default_levels<T>(),
                          Weight<T> weight = LearningRate<T>{},
                          std::size_t inner_steps = 10, T inner_scale = T{10})
        : weight_(std::move(weight)),
          taus_(detail::checked_levels(std::move(taus))),
          value_(taus_.size(), T{0}),
          inner_steps_(inner_steps),
          inner_scale_(inner_scale) {
        validate_positive(inner_steps, "QuantileISGD inner_steps");
        validate_positive(inner_scale, "QuantileISGD inner_scale");
    }

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        const T gamma = policy.advance();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        for (std::size_t i = 0; i < taus_.size(); ++i) {
            const T start = value_[i];
            T x = start;
            for (std::size_t k = 1; k <= inner_steps_; ++k) {
                const T step = start - gamma * quantile_loss_deriv(taus_[i], y, x);
                x = smooth(x, step, std::min(T{1}, inner_scale_ / static_cast<T>(k)));
            }
            value_[i] = x;
        }
    }

    void merge(const QuantileISGD& other) {
        merge(other, merge_coefficient<T>(n_, other.n_));
    }

    void merge(const QuantileISGD& other, T gamma) {
        detail::check_same_levels(taus_, other.taus_, "QuantileISGD::merge");
        if (inner_steps_ != other.inner_steps_ || inner_scale_ != other.inner_scale_) {
            throw IncompatibleConfig("QuantileISGD::merge: different inner-step settings");
        }
        if (other.n_ == 0) return;
        smooth_vec(value_, other.value_, gamma);
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] const std::vector<T>& taus() const noexcept { return taus_; }
    [[nodiscard]] const std::vector<T>& value() const noexcept { return value_; }
    [[nodiscard]] constexpr std::size_t inner_steps() const noexcept { return inner_steps_; }
    [[nodiscard]] constexpr T inner_scale() const noexcept { return inner_scale_; }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        std::fill(value_.begin(), value_.end(), T{0});
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    std::vector<T> taus_;
    std::vector<T> value_;
    std::size_t inner_steps_;
    T inner_scale_;
};

// --- QuantileMM --------------------------------------------------------------

/**
 * @brief Quantiles by an online majorize-minimize algorithm.
 *
 * The pinball loss is majorized at the current estimate by a quadratic with
 * weight `w = 1 / (|y - v| + epsilon)`; smoothed sufficient statistics
 * `s = E[w y]`, `t = E[w]` and `o = E[1]` give the closed-form minimizer
 * `v = (s + o (2 tau - 1)) / t`.
 */
template <typename T = double>
class QuantileMM {
    static_assert(std::is_floating_point_v<T>, "QuantileMM requires floating point T");

public:
    explicit QuantileMM(std::vector<T> taus = detail::default_levels<T>(),
                        Weight<T> weight = LearningRate<T>{}, T epsilon = T{1e-8})
        : weight_(std::move(weight)),
          taus_(detail::checked_levels(std::move(taus))),
          value_(taus_.size(), T{0}),
          s_(taus_.size(), T{0}),
          t_(taus_.size(), T{0}),
          epsilon_(epsilon) {
        validate_positive(epsilon, "QuantileMM epsilon");
    }

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        const T gamma = policy.advance();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        o_ = smooth(o_, T{1}, gamma);
        for (std::size_t j = 0; j < taus_.size(); ++j) {
            const T w = T{1} / (std::abs(y - value_[j]) + epsilon_);
            s_[j] = smooth(s_[j], w * y, gamma);
            t_[j] = smooth(t_[j], w, gamma);
            value_[j] = (s_[j] + o_ * (T{2} * taus_[j] - T{1})) / t_[j];
        }
    }

    void merge(const QuantileMM& other) {
        merge(other, merge_coefficient<T>(n_, other.n_));
    }

    void merge(const QuantileMM& other, T gamma) {
        detail::check_same_levels(taus_, other.taus_, "QuantileMM::merge");
        if (other.n_ == 0) return;
        o_ = smooth(o_, other.o_, gamma);
        smooth_vec(s_, other.s_, gamma);
        smooth_vec(t_, other.t_, gamma);
        for (std::size_t j = 0; j < taus_.size(); ++j) {
            value_[j] = (s_[j] + o_ * (T{2} * taus_[j] - T{1})) / t_[j];
        }
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] const std::vector<T>& taus() const noexcept { return taus_; }
    [[nodiscard]] const std::vector<T>& value() const noexcept { return value_; }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        o_ = T{0};
        std::fill(value_.begin(), value_.end(), T{0});
        std::fill(s_.begin(), s_.end(), T{0});
        std::fill(t_.begin(), t_.end(), T{0});
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    std::vector<T> taus_;
    std::vector<T> value_;
    std::vector<T> s_;
    std::vector<T> t_;
    T o_{0};
    T epsilon_;
};

}  // namespace streamfuse
