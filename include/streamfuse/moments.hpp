#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <type_traits>
#include <utility>

#include <streamfuse/smooth.hpp>
#include <streamfuse/weight.hpp>

namespace streamfuse {

/**
 * @brief First four non-central moments `E[y], E[y^2], E[y^3], E[y^4]`.
 *
 * Raw moments smooth and merge without any mean-shift correction, so
 * `merge(other, gamma)` is a plain elementwise smooth. Central quantities are
 * derived on demand:
 * - `variance()` is bias corrected by the weight policy,
 * - `skewness()` and `kurtosis()` (excess) use population central moments.
 *
 * All derived accessors return NaN until two observations are in.
 */
template <typename T = double>
class Moments {
    static_assert(std::is_floating_point_v<T>, "Moments requires floating point T");

public:
    explicit Moments(Weight<T> weight = {}) : weight_(std::move(weight)) {}

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        const T gamma = policy.advance();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        const T y2 = y * y;
        m_[0] = smooth(m_[0], y, gamma);
        m_[1] = smooth(m_[1], y2, gamma);
        m_[2] = smooth(m_[2], y2 * y, gamma);
        m_[3] = smooth(m_[3], y2 * y2, gamma);
    }

    void merge(const Moments& other) { merge(other, merge_coefficient<T>(n_, other.n_)); }

    void merge(const Moments& other, T gamma) {
        if (other.n_ == 0) return;
        for (std::size_t k = 0; k < m_.size(); ++k) m_[k] = smooth(m_[k], other.m_[k], gamma);
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] constexpr const std::array<T, 4>& value() const noexcept { return m_; }

    [[nodiscard]] T mean() const noexcept {
        if (n_ < 1) return std::numeric_limits<T>::quiet_NaN();
        return m_[0];
    }

    [[nodiscard]] T variance() const noexcept {
        if (n_ < 2) return std::numeric_limits<T>::quiet_NaN();
        return central2() * weight_.bias_correction(n_);
    }

    [[nodiscard]] T stddev() const noexcept { return std::sqrt(variance()); }

    [[nodiscard]] T skewness() const noexcept {
        if (n_ < 2) return std::numeric_limits<T>::quiet_NaN();
        const T mu = m_[0];
        const T c3 = m_[2] - T{3} * mu * m_[1] + T{2} * mu * mu * mu;
        return c3 / std::pow(central2(), T{1.5});
    }

    [[nodiscard]] T kurtosis() const noexcept {
        if (n_ < 2) return std::numeric_limits<T>::quiet_NaN();
        const T mu = m_[0];
        const T mu2 = mu * mu;
        const T c4 = m_[3] - T{4} * mu * m_[2] + T{6} * mu2 * m_[1] - T{3} * mu2 * mu2;
        const T c2 = central2();
        return c4 / (c2 * c2) - T{3};
    }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        m_.fill(T{0});
        weight_.reset();
    }

private:
    [[nodiscard]] T central2() const noexcept { return m_[1] - m_[0] * m_[0]; }

    Weight<T> weight_;
    std::size_t n_{0};
    std::array<T, 4> m_{};
};

}  // namespace streamfuse
