#ifndef GPUMON_HISTORY_RING_BUFFER_HPP
#define GPUMON_HISTORY_RING_BUFFER_HPP
/**
 * @file RingBuffer.hpp
 * @brief Fixed-capacity FIFO ring buffer.
 * @note NOT thread-safe. Callers synchronize.
 *
 * Storage is allocated once at construction; push() is O(1) and overwrites
 * the oldest element when full. size() never exceeds capacity().
 */

#include <algorithm> // std::max
#include <cstddef>   // std::size_t
#include <type_traits> // std::is_nothrow_move_assignable_v
#include <utility>   // std::move
#include <vector>    // std::vector

namespace gpumon {

namespace history {

/* ----------------------------- RingBuffer ----------------------------- */

template <typename T> class RingBuffer {
public:
  /// @param capacity Maximum element count (a capacity of 0 is raised to 1).
  explicit RingBuffer(std::size_t capacity) : slots_(std::max<std::size_t>(capacity, 1)) {}

  /// Append @p value, evicting the oldest element when full.
  void push(T value) noexcept(std::is_nothrow_move_assignable_v<T>) {
    const std::size_t CAP = slots_.size();
    if (size_ < CAP) {
      slots_[(head_ + size_) % CAP] = std::move(value);
      ++size_;
    } else {
      slots_[head_] = std::move(value);
      head_ = (head_ + 1) % CAP;
    }
  }

  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
  [[nodiscard]] bool full() const noexcept { return size_ == slots_.size(); }

  /// Element @p index counted from the oldest. Precondition: index < size().
  [[nodiscard]] const T& operator[](std::size_t index) const noexcept {
    return slots_[(head_ + index) % slots_.size()];
  }

  /// Oldest element. Precondition: !empty().
  [[nodiscard]] const T& front() const noexcept { return (*this)[0]; }

  /// Newest element. Precondition: !empty().
  [[nodiscard]] const T& back() const noexcept { return (*this)[size_ - 1]; }

  /// Copy of the contents, oldest first.
  [[nodiscard]] std::vector<T> toVector() const {
    std::vector<T> out;
    out.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
      out.push_back((*this)[i]);
    }
    return out;
  }

  /// Drop every element; capacity is retained.
  void clear() noexcept {
    head_ = 0;
    size_ = 0;
  }

private:
  std::vector<T> slots_;
  std::size_t head_{0}; ///< Index of the oldest element
  std::size_t size_{0};
};

} // namespace history

} // namespace gpumon

#endif // GPUMON_HISTORY_RING_BUFFER_HPP
