#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

#include <streamfuse/weight.hpp>

namespace streamfuse {

// Running total. Coefficients play no role; the policy only counts.
template <typename T = double>
class Sum {
    static_assert(std::is_floating_point_v<T>, "Sum requires floating point T");

public:
    explicit Sum(Weight<T> weight = {}) : weight_(std::move(weight)) {}

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        policy.advance_silent();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        sum_ += y;
    }

    void merge(const Sum& other) { merge(other, T{0}); }

    void merge(const Sum& other, T /*gamma*/) {
        if (other.n_ == 0) return;
        sum_ += other.sum_;
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] constexpr T value() const noexcept { return sum_; }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        sum_ = T{0};
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    T sum_{0};
};

// Last value and the difference to the one before it (0 until two values are in).
template <typename T = double>
class Diff {
    static_assert(std::is_floating_point_v<T>, "Diff requires floating point T");

public:
    explicit Diff(Weight<T> weight = {}) : weight_(std::move(weight)) {}

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        policy.advance_silent();
        if (&policy != &weight_) weight_.advance_silent();
        diff_ = n_ > 0 ? y - last_ : T{0};
        last_ = y;
        ++n_;
    }

    void merge(const Diff& other) { merge(other, T{1}); }

    // `other` is taken to follow this stream.
    void merge(const Diff& other, T /*gamma*/) {
        if (other.n_ == 0) return;
        if (other.n_ > 1) {
            diff_ = other.diff_;
        } else {
            diff_ = n_ > 0 ? other.last_ - last_ : T{0};
        }
        last_ = other.last_;
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] constexpr T value() const noexcept { return diff_; }
    [[nodiscard]] constexpr T last() const noexcept { return last_; }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        diff_ = T{0};
        last_ = T{0};
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    T diff_{0};
    T last_{0};
};

}  // namespace streamfuse
