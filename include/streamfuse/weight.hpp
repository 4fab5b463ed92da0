#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <variant>

#include <streamfuse/error.hpp>

namespace streamfuse {

// --- Policies ----------------------------------------------------------------
//
// Each policy exposes `next(n_new, total, updates)`, called by `Weight` after
// the observation count and the update counter have been advanced.

/// All observations weighted equally: coefficient `n_new / total`.
template <typename T = double>
struct EqualWeight {
    [[nodiscard]] constexpr T next(std::size_t n_new, std::size_t total,
                                   std::size_t /*updates*/) const noexcept {
        return static_cast<T>(n_new) / static_cast<T>(total);
    }
};

/// Constant coefficient `lambda`, i.e. exponentially decaying memory.
template <typename T = double>
class ExponentialWeight {
public:
    explicit ExponentialWeight(T lambda = T{1}) : lambda_(lambda) {
        validate_unit_interval(lambda, "ExponentialWeight lambda");
    }

    /// `lambda = 2 / (lookback + 1)`.
    [[nodiscard]] static ExponentialWeight from_lookback(std::size_t lookback) {
        validate_positive(lookback, "ExponentialWeight lookback");
        return ExponentialWeight(T{2} / static_cast<T>(lookback + 1));
    }

    [[nodiscard]] constexpr T next(std::size_t, std::size_t, std::size_t) const noexcept {
        return lambda_;
    }

    [[nodiscard]] constexpr T lambda() const noexcept { return lambda_; }

private:
    T lambda_;
};

/// Equal weights until the coefficient would drop below `lambda`, then hold.
template <typename T = double>
class BoundedExponentialWeight {
public:
    explicit BoundedExponentialWeight(T lambda = T{1}) : lambda_(lambda) {
        validate_unit_interval(lambda, "BoundedExponentialWeight lambda");
    }

    [[nodiscard]] static BoundedExponentialWeight from_lookback(std::size_t lookback) {
        validate_positive(lookback, "BoundedExponentialWeight lookback");
        return BoundedExponentialWeight(T{2} / static_cast<T>(lookback + 1));
    }

    [[nodiscard]] constexpr T next(std::size_t n_new, std::size_t total,
                                   std::size_t) const noexcept {
        return std::max(static_cast<T>(n_new) / static_cast<T>(total), lambda_);
    }

    [[nodiscard]] constexpr T lambda() const noexcept { return lambda_; }

private:
    T lambda_;
};

/// Coefficient `max(minstep, t^-r)` where `t` counts updates, not observations.
template <typename T = double>
class LearningRate {
public:
    explicit LearningRate(T r = T{0.6}, T minstep = T{0}) : r_(r), minstep_(minstep) {
        validate_non_negative(r, "LearningRate r");
        validate_unit_interval(minstep, "LearningRate minstep");
    }

    [[nodiscard]] T next(std::size_t, std::size_t, std::size_t updates) const {
        return std::max(minstep_, std::pow(static_cast<T>(updates), -r_));
    }

    [[nodiscard]] constexpr T r() const noexcept { return r_; }
    [[nodiscard]] constexpr T minstep() const noexcept { return minstep_; }

private:
    T r_;
    T minstep_;
};

/// Coefficient `max(minstep, gamma / (1 + gamma * c * t))`.
template <typename T = double>
class LearningRate2 {
public:
    explicit LearningRate2(T gamma, T c = T{1}, T minstep = T{0})
        : gamma_(gamma), c_(c), minstep_(minstep) {
        validate_positive(gamma, "LearningRate2 gamma");
        validate_unit_interval(gamma, "LearningRate2 gamma");
        validate_non_negative(c, "LearningRate2 c");
        validate_unit_interval(minstep, "LearningRate2 minstep");
    }

    [[nodiscard]] constexpr T next(std::size_t, std::size_t,
                                   std::size_t updates) const noexcept {
        const T t = static_cast<T>(updates);
        return std::max(minstep_, gamma_ / (T{1} + gamma_ * c_ * t));
    }

    [[nodiscard]] constexpr T gamma() const noexcept { return gamma_; }
    [[nodiscard]] constexpr T c() const noexcept { return c_; }
    [[nodiscard]] constexpr T minstep() const noexcept { return minstep_; }

private:
    T gamma_;
    T c_;
    T minstep_;
};

/// Caller-supplied weights; coefficient is the latest weight's share `w / sum(w)`.
template <typename T = double>
class UserWeight {
public:
    explicit UserWeight(T w = T{1}) : w_(w) {
        validate_positive(w, "UserWeight w");
    }

    [[nodiscard]] T next(std::size_t, std::size_t, std::size_t) {
        denom_ += w_;
        return w_ / denom_;
    }

    void set(T w) {
        validate_positive(w, "UserWeight w");
        w_ = w;
    }

    void skip() noexcept { denom_ += w_; }
    void reset() noexcept { denom_ = T{0}; }

    [[nodiscard]] constexpr T w() const noexcept { return w_; }
    [[nodiscard]] constexpr T total() const noexcept { return denom_; }

private:
    T w_;
    T denom_{0};
};

// --- Weight ------------------------------------------------------------------

/**
 * @brief Stateful weight policy turning observation counts into blend
 * coefficients.
 *
 * A `Weight` owns one policy from a small closed set and two counters:
 * - `count()`: total observations seen (advanced by `n_new` on every call),
 * - `updates()`: number of `advance`/`advance_silent` calls, the `t` used by
 *   the learning-rate policies.
 *
 * `advance(n_new)` mutates both counters and returns the coefficient for the
 * next smoothing step. `advance_silent(n_new)` mutates the counters without
 * producing a coefficient; accumulators use it when they track observations
 * without smoothing (extrema, categorical counts, merges).
 *
 * The returned coefficient lies in (0, 1] for every policy except an
 * `ExponentialWeight` or `BoundedExponentialWeight` explicitly built with
 * `lambda == 0` (and then only once the equal-weight phase is over).
 *
 * @tparam T Floating-point type of the coefficient.
 */
template <typename T = double>
class Weight {
    static_assert(std::is_floating_point_v<T>, "Weight requires floating point T");

public:
    using Policy = std::variant<EqualWeight<T>, ExponentialWeight<T>,
                                BoundedExponentialWeight<T>, LearningRate<T>,
                                LearningRate2<T>, UserWeight<T>>;

    Weight() = default;

    template <class P, class = std::enable_if_t<std::is_constructible_v<Policy, P>
                                                && !std::is_same_v<std::decay_t<P>, Weight>>>
    Weight(P policy) : policy_(std::move(policy)) {}

    /**
     * @brief Record `n_new` observations and return the next blend coefficient.
     *
     * @throw InvalidParameter if `n_new == 0`.
     */
    T advance(std::size_t n_new = 1) {
        if (n_new == 0) throw InvalidParameter("Weight::advance requires n_new >= 1");
        count_ += n_new;
        ++updates_;
        return std::visit(
            [&](auto& p) -> T { return p.next(n_new, count_, updates_); }, policy_);
    }

    /// Same counter mutation as `advance`, without a coefficient.
    void advance_silent(std::size_t n_new = 1) {
        if (n_new == 0) return;
        count_ += n_new;
        ++updates_;
        if (auto* user = std::get_if<UserWeight<T>>(&policy_)) user->skip();
    }

    /**
     * @brief Set the raw weight used by the next `advance` call.
     *
     * @throw InvalidParameter if the policy is not a `UserWeight` or `w <= 0`.
     */
    void set_user_weight(T w) {
        auto* user = std::get_if<UserWeight<T>>(&policy_);
        if (!user) throw InvalidParameter("set_user_weight requires a UserWeight policy");
        user->set(w);
    }

    /**
     * @brief Factor turning a biased (population) second moment into an
     * unbiased one.
     *
     * `n / (n - 1)` for equal weighting once `n > 1`, otherwise 1. `n` is the
     * observation count of the accumulator asking, which need not equal
     * `count()` when the policy is shared.
     */
    [[nodiscard]] T bias_correction(std::size_t n) const noexcept {
        if (n > 1 && std::holds_alternative<EqualWeight<T>>(policy_)) {
            return static_cast<T>(n) / static_cast<T>(n - 1);
        }
        return T{1};
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return count_; }
    [[nodiscard]] constexpr std::size_t updates() const noexcept { return updates_; }
    [[nodiscard]] constexpr const Policy& policy() const noexcept { return policy_; }

    template <class P>
    [[nodiscard]] constexpr bool holds() const noexcept {
        return std::holds_alternative<P>(policy_);
    }

    void reset() noexcept {
        count_ = 0;
        updates_ = 0;
        if (auto* user = std::get_if<UserWeight<T>>(&policy_)) user->reset();
    }

private:
    Policy policy_{EqualWeight<T>{}};
    std::size_t count_{0};
    std::size_t updates_{0};
};

/// Coefficient for merging `n_other` observations into `n_self`.
template <typename T = double>
[[nodiscard]] constexpr T merge_coefficient(std::size_t n_self, std::size_t n_other) noexcept {
    if (n_self + n_other == 0) return T{0};
    return static_cast<T>(n_other) / static_cast<T>(n_self + n_other);
}

}  // namespace streamfuse
