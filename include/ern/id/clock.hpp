#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace ern::id {

// Time source for root id generation. Readings are durations since the Unix
// epoch. Implementations must be safe to call from multiple threads.
class Clock {
 public:
  Clock() = default;
  Clock(const Clock&) = delete;
  Clock(Clock&&) = delete;
  auto operator=(const Clock&) -> Clock& = delete;
  auto operator=(Clock&&) -> Clock& = delete;
  virtual ~Clock() = default;

  [[nodiscard]] virtual auto Now() const -> std::chrono::nanoseconds = 0;
};

class SystemClock final : public Clock {
 public:
  [[nodiscard]] auto Now() const -> std::chrono::nanoseconds override;
};

// Clock that only moves when told to. Used for deterministic generation.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(std::chrono::nanoseconds start = {})
      : now_ns_(start.count()) {
  }

  [[nodiscard]] auto Now() const -> std::chrono::nanoseconds override {
    return std::chrono::nanoseconds(now_ns_.load(std::memory_order_acquire));
  }

  void Set(std::chrono::nanoseconds now) {
    now_ns_.store(now.count(), std::memory_order_release);
  }

  // Negative deltas are allowed, to simulate a wall clock stepping back.
  void Advance(std::chrono::nanoseconds delta) {
    now_ns_.fetch_add(delta.count(), std::memory_order_acq_rel);
  }

 private:
  std::atomic<int64_t> now_ns_;
};

}  // namespace ern::id
