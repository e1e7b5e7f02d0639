#pragma once

#include <string>
#include <utility>

#include "ern/common/error.hpp"
#include "ern/model/ern.hpp"

namespace ern {

// Decodes a canonical ERN string:
//
//   ern:<domain>:<category>:<account>:<root>[/<part>...]
//
// The input is split on ':' into at most five fields, so any ':' after the
// fourth lands in the root/path field and is rejected there by segment
// validation. The root is taken verbatim (Root::Parse); no token is generated.
// The first invalid component fails the whole parse.
class ErnParser {
 public:
  explicit ErnParser(std::string text) : text_(std::move(text)) {
  }

  [[nodiscard]] auto Parse() const -> Result<Ern>;

 private:
  std::string text_;
};

}  // namespace ern
