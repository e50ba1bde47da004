#pragma once

#include <atomic>
#include <chrono>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace common {

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

class Clock {
 public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual Timestamp now() const noexcept = 0;
};

class SystemClock final : public Clock {
 public:
  [[nodiscard]] Timestamp now() const noexcept override {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

// Externally driven clock for tests and journal replay.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(Timestamp start = 0) noexcept : now_(start) {}

  [[nodiscard]] Timestamp now() const noexcept override {
    return now_.load(std::memory_order_acquire);
  }
  void set(Timestamp value) noexcept { now_.store(value, std::memory_order_release); }
  void advance(Timestamp seconds) noexcept { now_.fetch_add(seconds, std::memory_order_acq_rel); }

 private:
  std::atomic<Timestamp> now_;
};

}  // namespace common
}  // namespace perpcore
