#include "ern/model/parts.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ern {

auto Parts::Append(Part part) const -> Parts {
  std::vector<Part> parts = parts_;
  parts.push_back(std::move(part));
  return Parts(std::move(parts));
}

auto Parts::Concat(const Parts& other) const -> Parts {
  std::vector<Part> parts;
  parts.reserve(parts_.size() + other.parts_.size());
  parts.insert(parts.end(), parts_.begin(), parts_.end());
  parts.insert(parts.end(), other.parts_.begin(), other.parts_.end());
  return Parts(std::move(parts));
}

auto Parts::WithoutLast() const -> Parts {
  if (parts_.empty()) {
    return {};
  }
  return Parts(std::vector<Part>(parts_.begin(), parts_.end() - 1));
}

auto Parts::StartsWith(const Parts& prefix) const -> bool {
  return prefix.parts_.size() <= parts_.size() &&
         std::equal(
             prefix.parts_.begin(), prefix.parts_.end(), parts_.begin());
}

auto Parts::ToString() const -> std::string {
  std::vector<std::string_view> views;
  views.reserve(parts_.size());
  for (const auto& part : parts_) {
    views.push_back(part.AsStringView());
  }
  return fmt::format("{}", fmt::join(views, "/"));
}

}  // namespace ern

auto std::hash<ern::Parts>::operator()(const ern::Parts& parts) const noexcept
    -> std::size_t {
  std::size_t seed = parts.Size();
  for (const auto& part : parts) {
    seed ^= std::hash<ern::Part>{}(part) + 0x9e3779b97f4a7c15ULL + (seed << 6) +
            (seed >> 2);
  }
  return seed;
}
