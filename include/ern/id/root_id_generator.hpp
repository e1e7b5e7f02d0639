#pragma once

#include <compare>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "ern/id/clock.hpp"
#include "ern/id/token.hpp"

namespace ern::id {

namespace detail {

// Position of a token on the time axis: clock quantum plus counter.
struct Tick {
  uint64_t ms = 0;
  uint64_t sub_ms = 0;
  uint64_t counter = 0;

  auto operator<=>(const Tick&) const = default;
};

// Tick to issue for a clock reading of (ms, sub_ms), given the last tick
// issued (if any). A reading past `last` starts a new tick with a fresh
// counter from `rng`; any other reading continues from `last` with counter + 1,
// carrying into sub_ms and then ms on overflow. The result is always greater
// than `last`.
auto AdvanceTick(
    const std::optional<Tick>& last, uint64_t ms, uint64_t sub_ms,
    std::mt19937_64& rng) -> Tick;

}  // namespace detail

// Produces strictly increasing, collision-resistant tokens.
//
// Each call reads the clock at sub-millisecond resolution. A reading later
// than the last emitted (ms, sub_ms) pair starts a new tick with a randomly
// seeded counter. Otherwise (same tick, or the clock stepped back) the last
// tick is reused and the counter incremented; counter overflow carries into
// the tick. Every token is therefore greater than all tokens emitted before
// it by the same generator, from any thread.
class RootIdGenerator {
 public:
  RootIdGenerator();
  explicit RootIdGenerator(std::shared_ptr<const Clock> clock);
  RootIdGenerator(std::shared_ptr<const Clock> clock, uint64_t seed);

  RootIdGenerator(const RootIdGenerator&) = delete;
  RootIdGenerator(RootIdGenerator&&) = delete;
  auto operator=(const RootIdGenerator&) -> RootIdGenerator& = delete;
  auto operator=(RootIdGenerator&&) -> RootIdGenerator& = delete;
  ~RootIdGenerator() = default;

  [[nodiscard]] auto Next() -> Token;

  // Next token in its 26-character base32 form.
  [[nodiscard]] auto NextEncoded() -> std::string;

  // Process-wide generator backed by the system clock.
  static auto Default() -> RootIdGenerator&;

 private:
  std::shared_ptr<const Clock> clock_;

  std::mutex mutex_;
  std::mt19937_64 rng_;
  std::optional<detail::Tick> last_;
};

}  // namespace ern::id
