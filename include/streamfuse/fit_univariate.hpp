#pragma once

#include <cmath>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#include <streamfuse/error.hpp>
#include <streamfuse/quantile.hpp>
#include <streamfuse/variance.hpp>
#include <streamfuse/weight.hpp>

namespace streamfuse {

// --- Parameter sets ----------------------------------------------------------

template <typename T = double>
struct BetaParams {
    T alpha;
    T beta;
};

template <typename T = double>
struct GammaParams {
    T shape;
    T scale;
};

template <typename T = double>
struct NormalParams {
    T mean;
    T stddev;
};

// Parameters of log(y).
template <typename T = double>
struct LogNormalParams {
    T meanlog;
    T sdlog;
};

template <typename T = double>
struct CauchyParams {
    T location;
    T scale;
};

// --- Fitters -----------------------------------------------------------------
//
// Every fitter owns one inner accumulator, forwards absorb/merge to it and
// transforms its value on demand. Until two observations are in, `value()`
// returns the documented default parameters instead of failing.

/// Beta(alpha, beta) by method of moments. Default `(1, 1)`.
template <typename T = double>
class FitBeta {
public:
    explicit FitBeta(Weight<T> weight = {}) : var_(std::move(weight)) {}

    void absorb(T y) { var_.absorb(y); }
    void merge(const FitBeta& other) { var_.merge(other.var_); }
    void merge(const FitBeta& other, T gamma) { var_.merge(other.var_, gamma); }

    [[nodiscard]] BetaParams<T> value() const {
        if (var_.count() < 2) return {T{1}, T{1}};
        const T m = var_.mean();
        const T k = m * (T{1} - m) / var_.value() - T{1};
        return {m * k, (T{1} - m) * k};
    }

    [[nodiscard]] std::size_t count() const noexcept { return var_.count(); }
    [[nodiscard]] const Variance<T>& variance() const noexcept { return var_; }

private:
    Variance<T> var_;
};

/// Gamma(shape, scale) by method of moments. Default `(1, 1)`.
template <typename T = double>
class FitGamma {
public:
    explicit FitGamma(Weight<T> weight = {}) : var_(std::move(weight)) {}

    void absorb(T y) { var_.absorb(y); }
    void merge(const FitGamma& other) { var_.merge(other.var_); }
    void merge(const FitGamma& other, T gamma) { var_.merge(other.var_, gamma); }

    [[nodiscard]] GammaParams<T> value() const {
        if (var_.count() < 2) return {T{1}, T{1}};
        const T m = var_.mean();
        const T scale = var_.value() / m;
        return {m / scale, scale};
    }

    [[nodiscard]] std::size_t count() const noexcept { return var_.count(); }
    [[nodiscard]] const Variance<T>& variance() const noexcept { return var_; }

private:
    Variance<T> var_;
};

/// Normal(mean, stddev) by maximum likelihood. Default `(0, 1)`.
template <typename T = double>
class FitNormal {
public:
    explicit FitNormal(Weight<T> weight = {}) : var_(std::move(weight)) {}

    void absorb(T y) { var_.absorb(y); }
    void merge(const FitNormal& other) { var_.merge(other.var_); }
    void merge(const FitNormal& other, T gamma) { var_.merge(other.var_, gamma); }

    [[nodiscard]] NormalParams<T> value() const {
        if (var_.count() < 2) return {T{0}, T{1}};
        return {var_.mean(), var_.stddev()};
    }

    [[nodiscard]] std::size_t count() const noexcept { return var_.count(); }
    [[nodiscard]] const Variance<T>& variance() const noexcept { return var_; }

private:
    Variance<T> var_;
};

/**
 * @brief LogNormal(meanlog, sdlog) by maximum likelihood on `log(y)`.
 *
 * Default `(0, 1)`.
 *
 * @throw InvalidParameter from `absorb` if `y <= 0`.
 */
template <typename T = double>
class FitLogNormal {
public:
    explicit FitLogNormal(Weight<T> weight = {}) : var_(std::move(weight)) {}

    void absorb(T y) {
        if (!(y > T{0})) throw InvalidParameter("FitLogNormal requires positive observations");
        var_.absorb(std::log(y));
    }
    void merge(const FitLogNormal& other) { var_.merge(other.var_); }
    void merge(const FitLogNormal& other, T gamma) { var_.merge(other.var_, gamma); }

    [[nodiscard]] LogNormalParams<T> value() const {
        if (var_.count() < 2) return {T{0}, T{1}};
        return {var_.mean(), var_.stddev()};
    }

    [[nodiscard]] std::size_t count() const noexcept { return var_.count(); }
    [[nodiscard]] const Variance<T>& variance() const noexcept { return var_; }

private:
    Variance<T> var_;
};

/// Cauchy(location, scale) from the median and half the interquartile range
/// of an MM quantile estimator. Default `(0, 1)`.
template <typename T = double>
class FitCauchy {
public:
    explicit FitCauchy(Weight<T> weight = LearningRate<T>{})
        : q_({T{0.25}, T{0.5}, T{0.75}}, std::move(weight)) {}

    void absorb(T y) { q_.absorb(y); }
    void merge(const FitCauchy& other) { q_.merge(other.q_); }
    void merge(const FitCauchy& other, T gamma) { q_.merge(other.q_, gamma); }

    [[nodiscard]] CauchyParams<T> value() const {
        if (q_.count() < 2) return {T{0}, T{1}};
        const std::vector<T>& q = q_.value();
        return {q[1], T{0.5} * (q[2] - q[0])};
    }

    [[nodiscard]] std::size_t count() const noexcept { return q_.count(); }
    [[nodiscard]] const QuantileMM<T>& quantiles() const noexcept { return q_; }

private:
    QuantileMM<T> q_;
};

}  // namespace streamfuse
