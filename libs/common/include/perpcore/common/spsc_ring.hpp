#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace perpcore {
namespace common {

// Bounded single-producer/single-consumer ring. One slot is kept empty to
// distinguish full from empty, so usable capacity is capacity() - 1.
template <typename T>
class SpscRing {
 public:
  explicit SpscRing(std::size_t capacity_power_of_two)
      : slots_(capacity_power_of_two), mask_(capacity_power_of_two - 1) {
    if (capacity_power_of_two < 2 || (capacity_power_of_two & mask_) != 0) {
      throw std::invalid_argument("SpscRing capacity must be a power of two >= 2");
    }
  }

  [[nodiscard]] bool try_push(T value) {
    const std::size_t head = head_.load(std::memory_order_relaxed);
    const std::size_t next = (head + 1) & mask_;
    if (next == tail_.load(std::memory_order_acquire)) {
      return false;
    }
    slots_[head].emplace(std::move(value));
    head_.store(next, std::memory_order_release);
    return true;
  }

  [[nodiscard]] std::optional<T> try_pop() {
    const std::size_t tail = tail_.load(std::memory_order_relaxed);
    if (tail == head_.load(std::memory_order_acquire)) {
      return std::nullopt;
    }
    std::optional<T> out = std::move(slots_[tail]);
    slots_[tail].reset();
    tail_.store((tail + 1) & mask_, std::memory_order_release);
    return out;
  }

  [[nodiscard]] std::size_t size() const noexcept {
    const std::size_t head = head_.load(std::memory_order_acquire);
    const std::size_t tail = tail_.load(std::memory_order_acquire);
    return (head - tail) & mask_;
  }

  [[nodiscard]] bool empty() const noexcept { return size() == 0; }
  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

 private:
  std::vector<std::optional<T>> slots_;
  const std::size_t mask_;
  std::atomic<std::size_t> head_{0};
  std::atomic<std::size_t> tail_{0};
};

}  // namespace common
}  // namespace perpcore
