#pragma once
// ============================================================================
// TACORE - Lookback Window
// ============================================================================
// Fixed-capacity ring buffer holding the last N observations
// Prefilled with a seed so every push has a well-defined evicted value
// ============================================================================

#include "tacore/core/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace tacore {

template <typename T>
class Window {
public:
    /// Throws std::invalid_argument for a zero capacity
    Window(PeriodType capacity, const T& seed)
        : buffer_(check_capacity(capacity), seed), index_(0) {}

    /// Push a new item, returning the oldest one (the seed until the window has
    /// seen `capacity` pushes)
    T push(const T& item) {
        T evicted = buffer_[index_];
        buffer_[index_] = item;
        index_ = (index_ + 1 == buffer_.size()) ? 0 : index_ + 1;
        return evicted;
    }

    /// i=0 is the most recent item
    [[nodiscard]] const T& operator[](size_t i) const {
        const size_t n = buffer_.size();
        return buffer_[(index_ + n - 1 - (i % n)) % n];
    }

    [[nodiscard]] const T& newest() const { return (*this)[0]; }

    /// Item evicted by the next push
    [[nodiscard]] const T& oldest() const { return buffer_[index_]; }

    [[nodiscard]] size_t capacity() const noexcept { return buffer_.size(); }

private:
    static size_t check_capacity(PeriodType capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("Window capacity must be positive");
        }
        return static_cast<size_t>(capacity);
    }

    std::vector<T> buffer_;
    size_t index_;
};

}  // namespace tacore
