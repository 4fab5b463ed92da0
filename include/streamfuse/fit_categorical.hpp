#pragma once

#include <cstddef>
#include <map>
#include <type_traits>
#include <utility>

#include <streamfuse/weight.hpp>

namespace streamfuse {

/**
 * @brief Categorical distribution over observed values of type `Key`.
 *
 * Keeps an exact frequency table, so the weight policy only tracks the
 * observation count. `value()` maps every key seen so far to its relative
 * frequency and is empty before the first observation. Merging takes the union
 * of both key sets and adds the counts.
 *
 * @tparam Key Ordered (`operator<`) observation type.
 * @tparam T   Floating-point type of the reported probabilities.
 */
template <typename Key, typename T = double>
class FitCategorical {
    static_assert(std::is_floating_point_v<T>, "FitCategorical requires floating point T");

public:
    explicit FitCategorical(Weight<T> weight = {}) : weight_(std::move(weight)) {}

    void absorb(const Key& y) {
        weight_.advance_silent();
        ++n_;
        ++counts_[y];
    }

    void merge(const FitCategorical& other) {
        if (other.n_ == 0) return;
        for (const auto& [key, c] : other.counts_) counts_[key] += c;
        n_ += other.n_;
        weight_.advance_silent(other.n_);
    }

    void merge(const FitCategorical& other, T /*gamma*/) { merge(other); }

    [[nodiscard]] std::map<Key, T> value() const {
        std::map<Key, T> p;
        for (const auto& [key, c] : counts_) {
            p.emplace(key, static_cast<T>(c) / static_cast<T>(n_));
        }
        return p;
    }

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] const std::map<Key, std::size_t>& counts() const noexcept { return counts_; }

    void reset() noexcept {
        n_ = 0;
        counts_.clear();
        weight_.reset();
    }

private:
    Weight<T> weight_;
    std::size_t n_{0};
    std::map<Key, std::size_t> counts_;
};

}  // namespace streamfuse
