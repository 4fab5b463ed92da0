#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace streamfuse {

// --- Error taxonomy ----------------------------------------------------------
//
// Construction and shape errors are thrown immediately. Numerical degeneracies
// (too few observations, zero denominators) are never thrown; accessors return
// documented sentinel values instead.

/// A policy or statistic was configured with an out-of-range parameter.
class InvalidParameter : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// An observation or peer accumulator has the wrong vector/matrix dimension.
class ShapeMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Two accumulators with different structural parameters were merged.
class IncompatibleConfig : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// --- Validation helpers ------------------------------------------------------

template <typename T>
void validate_unit_interval(T value, const char* name) {
    if (!(value >= T{0} && value <= T{1})) {
        throw InvalidParameter(std::string(name) + " must be in [0, 1]; found "
                               + std::to_string(value));
    }
}

template <typename T>
void validate_open_unit_interval(T value, const char* name) {
    if (!(value > T{0} && value < T{1})) {
        throw InvalidParameter(std::string(name) + " must be in (0, 1); found "
                               + std::to_string(value));
    }
}

template <typename T>
void validate_positive(T value, const char* name) {
    if (!(value > T{0}) || !std::isfinite(static_cast<double>(value))) {
        throw InvalidParameter(std::string(name)
                               + " must be finite and positive; found "
                               + std::to_string(value));
    }
}

template <typename T>
void validate_non_negative(T value, const char* name) {
    if (!(value >= T{0}) || !std::isfinite(static_cast<double>(value))) {
        throw InvalidParameter(std::string(name)
                               + " must be finite and non-negative; found "
                               + std::to_string(value));
    }
}

inline void validate_same_size(std::size_t expected, std::size_t found,
                               const char* what) {
    if (expected != found) {
        throw ShapeMismatch(std::string(what) + ": expected size "
                            + std::to_string(expected) + ", found "
                            + std::to_string(found));
    }
}

}  // namespace streamfuse
