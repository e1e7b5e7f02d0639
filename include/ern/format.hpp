#pragma once

#include <string_view>

#include <fmt/format.h>

#include "ern/common/error.hpp"
#include "ern/model/ern.hpp"
#include "ern/model/parts.hpp"
#include "ern/model/root.hpp"
#include "ern/model/segment.hpp"

// fmt (and therefore spdlog) support for ERN value types. Each renders its
// canonical string form; format specs are those of string_view.

template <typename Traits>
struct fmt::formatter<ern::Segment<Traits>> : fmt::formatter<std::string_view> {
  auto format(const ern::Segment<Traits>& segment, fmt::format_context& ctx)
      const {
    return fmt::formatter<std::string_view>::format(
        segment.AsStringView(), ctx);
  }
};

template <>
struct fmt::formatter<ern::Parts> : fmt::formatter<std::string_view> {
  auto format(const ern::Parts& parts, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(parts.ToString(), ctx);
  }
};

template <>
struct fmt::formatter<ern::Root> : fmt::formatter<std::string_view> {
  auto format(const ern::Root& root, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(root.AsStringView(), ctx);
  }
};

template <>
struct fmt::formatter<ern::Ern> : fmt::formatter<std::string_view> {
  auto format(const ern::Ern& ern, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(ern.ToString(), ctx);
  }
};

template <>
struct fmt::formatter<ern::Error> : fmt::formatter<std::string_view> {
  auto format(const ern::Error& error, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(
        ern::FormatError(error), ctx);
  }
};
