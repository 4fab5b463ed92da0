#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <type_traits>
#include <utility>

#include <streamfuse/weight.hpp>

namespace streamfuse {

/**
 * @brief Running minimum and maximum.
 *
 * Before any observation `value()` is `(+inf, -inf)`. The weight policy is only
 * used to track the observation count.
 */
template <typename T = double>
class Extrema {
    static_assert(std::is_floating_point_v<T>, "Extrema requires floating point T");

public:
    explicit Extrema(Weight<T> weight = {}) : weight_(std::move(weight)) {}

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        policy.advance_silent();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        min_ = std::min(min_, y);
        max_ = std::max(max_, y);
    }

    void merge(const Extrema& other) { merge(other, merge_coefficient<T>(n_, other.n_)); }

    // The coefficient is irrelevant for extrema; kept for a uniform merge signature.
    void merge(const Extrema& other, T /*gamma*/) {
        if (other.n_ == 0) return;
        min_ = std::min(min_, other.min_);
        max_ = std::max(max_, other.max_);
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] constexpr std::pair<T, T> value() const noexcept { return {min_, max_}; }
    [[nodiscard]] constexpr T min() const noexcept { return min_; }
    [[nodiscard]] constexpr T max() const noexcept { return max_; }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        min_ = std::numeric_limits<T>::infinity();
        max_ = -std::numeric_limits<T>::infinity();
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    T min_{std::numeric_limits<T>::infinity()};
    T max_{-std::numeric_limits<T>::infinity()};
};

}  // namespace streamfuse
