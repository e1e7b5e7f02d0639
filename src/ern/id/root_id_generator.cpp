#include "ern/id/root_id_generator.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <tuple>
#include <utility>

#include <spdlog/spdlog.h>

#include "ern/common/internal_error.hpp"
#include "ern/id/base32.hpp"
#include "ern/id/clock.hpp"
#include "ern/id/token.hpp"

namespace ern::id {

namespace {

constexpr int64_t kNanosPerMilli = 1'000'000;

// Mix a wall-clock reading with random_device output. The time component
// keeps seeds distinct where random_device is deterministic.
auto SeedFromEntropy() -> std::mt19937_64 {
  static std::mutex rd_mutex;
  static std::random_device rd;

  std::array<uint32_t, 8> seed_data{};
  auto time_seed = static_cast<uint64_t>(
      std::chrono::high_resolution_clock::now().time_since_epoch().count());
  seed_data[0] = static_cast<uint32_t>(time_seed >> 32);
  seed_data[1] = static_cast<uint32_t>(time_seed);
  {
    std::lock_guard lock(rd_mutex);
    std::generate(seed_data.begin() + 2, seed_data.end(), std::ref(rd));
  }
  std::seed_seq seq(seed_data.begin(), seed_data.end());
  return std::mt19937_64(seq);
}

// New ticks start the counter in the lower half of its range, leaving at
// least 2^29 increments before it carries into the tick.
auto FreshCounter(std::mt19937_64& rng) -> uint64_t {
  return rng() & (Token::kMaxCounter >> 1);
}

}  // namespace

namespace detail {

auto AdvanceTick(
    const std::optional<Tick>& last, uint64_t ms, uint64_t sub_ms,
    std::mt19937_64& rng) -> Tick {
  Tick candidate{.ms = ms, .sub_ms = sub_ms, .counter = 0};
  if (!last || std::tie(ms, sub_ms) > std::tie(last->ms, last->sub_ms)) {
    candidate.counter = FreshCounter(rng);
    return candidate;
  }

  if (ms < last->ms) {
    spdlog::debug(
        "ern: clock moved back {}ms; continuing from last tick",
        last->ms - ms);
  }
  Tick next = *last;
  if (next.counter < Token::kMaxCounter) {
    ++next.counter;
    return next;
  }

  spdlog::debug("ern: counter exhausted in tick {}.{}", next.ms, next.sub_ms);
  next.counter = FreshCounter(rng);
  if (next.sub_ms < Token::kMaxSubMillis) {
    ++next.sub_ms;
  } else {
    next.sub_ms = 0;
    ++next.ms;
  }
  return next;
}

}  // namespace detail

RootIdGenerator::RootIdGenerator()
    : RootIdGenerator(std::make_shared<SystemClock>()) {
}

RootIdGenerator::RootIdGenerator(std::shared_ptr<const Clock> clock)
    : clock_(std::move(clock)), rng_(SeedFromEntropy()) {
}

RootIdGenerator::RootIdGenerator(
    std::shared_ptr<const Clock> clock, uint64_t seed)
    : clock_(std::move(clock)), rng_(seed) {
}

auto RootIdGenerator::Next() -> Token {
  auto now_ns = clock_->Now().count();
  if (now_ns < 0) {
    common::ThrowInternalError(
        "RootIdGenerator::Next",
        std::format("clock reading {}ns is before the Unix epoch", now_ns));
  }

  auto ms = static_cast<uint64_t>(now_ns / kNanosPerMilli);
  auto sub_ms = static_cast<uint64_t>(now_ns % kNanosPerMilli) *
                (Token::kMaxSubMillis + 1) / kNanosPerMilli;

  std::lock_guard lock(mutex_);

  auto tick = detail::AdvanceTick(last_, ms, sub_ms, rng_);
  last_ = tick;

  auto random = static_cast<uint32_t>(rng_());
  return Token::Make(tick.ms, tick.sub_ms, tick.counter, random);
}

auto RootIdGenerator::NextEncoded() -> std::string {
  return EncodeBase32(Next());
}

auto RootIdGenerator::Default() -> RootIdGenerator& {
  static RootIdGenerator generator;
  return generator;
}

}  // namespace ern::id
