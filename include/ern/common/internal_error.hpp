#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ern::common {

// Raised when ern reaches a state its own invariants exclude, such as a clock
// reading before the Unix epoch. Invalid caller input is reported as Error.
class InternalError : public std::runtime_error {
 public:
  InternalError(std::string_view where, std::string_view detail)
      : std::runtime_error(
            std::format("ern internal error at {}: {}", where, detail)),
        where_(where) {
  }

  [[nodiscard]] auto Where() const -> const std::string& {
    return where_;
  }

 private:
  std::string where_;
};

[[noreturn]] inline void ThrowInternalError(
    std::string_view where, std::string_view detail) {
  throw InternalError(where, detail);
}

}  // namespace ern::common
