#pragma once

#include <algorithm>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#include <streamfuse/error.hpp>
#include <streamfuse/smooth.hpp>
#include <streamfuse/weight.hpp>

namespace streamfuse {

/**
 * @brief Averaged order statistics over batches of `p` observations.
 *
 * Observations are buffered until `p` of them are in; the batch is then sorted
 * and the running order-statistic vector is smoothed toward it. The unit of
 * weighting is the batch: the coefficient comes from `batch_weight`, which
 * defaults to equal weighting over batches (`1 / batches()`).
 *
 * `value()` is all zeros until the first batch completes.
 */
template <typename T = double>
class OrderStats {
    static_assert(std::is_floating_point_v<T>, "OrderStats requires floating point T");

public:
    explicit OrderStats(std::size_t p, Weight<T> batch_weight = {}, Weight<T> weight = {})
        : weight_(std::move(weight)),
          batch_weight_(std::move(batch_weight)),
          value_(checked_size(p), T{0}),
          buffer_(p, T{0}) {}

    void absorb(T y) { absorb(y, weight_); }

    void absorb(T y, Weight<T>& policy) {
        policy.advance_silent();
        if (&policy != &weight_) weight_.advance_silent();
        ++n_;
        buffer_[fill_++] = y;
        if (fill_ == buffer_.size()) {
            std::sort(buffer_.begin(), buffer_.end());
            smooth_vec(value_, buffer_, batch_weight_.advance());
            fill_ = 0;
        }
    }

    void merge(const OrderStats& other) {
        merge(other, merge_coefficient<T>(batches(), other.batches()));
    }

    /**
     * @brief Merge completed batches with coefficient `gamma`, then replay the
     * other side's partially filled buffer through `absorb`.
     */
    void merge(const OrderStats& other, T gamma) {
        validate_same_size(size(), other.size(), "OrderStats::merge");
        if (other.batches() > 0) {
            smooth_vec(value_, other.value_, gamma);
            batch_weight_.advance_silent(other.batches());
        }
        const std::size_t batched = other.n_ - other.fill_;
        n_ += batched;
        weight_.advance_silent(batched);
        for (std::size_t i = 0; i < other.fill_; ++i) absorb(other.buffer_[i]);
    }

    [[nodiscard]] std::size_t size() const noexcept { return value_.size(); }
    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] std::size_t batches() const noexcept { return batch_weight_.count(); }
    [[nodiscard]] const std::vector<T>& value() const noexcept { return value_; }

    [[nodiscard]] const Weight<T>& weight() const noexcept { return weight_; }
    [[nodiscard]] Weight<T>& weight() noexcept { return weight_; }

    void reset() noexcept {
        n_ = 0;
        fill_ = 0;
        std::fill(value_.begin(), value_.end(), T{0});
        weight_.reset();
        batch_weight_.reset();
    }

private:
    static std::size_t checked_size(std::size_t p) {
        validate_positive(p, "OrderStats batch size");
        return p;
    }

    Weight<T> weight_;
    Weight<T> batch_weight_;
    std::size_t n_{0};
    std::size_t fill_{0};
    std::vector<T> value_;
    std::vector<T> buffer_;
};

}  // namespace streamfuse
