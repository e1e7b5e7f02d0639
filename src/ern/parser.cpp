#include "ern/parser.hpp"

#include <cstddef>
#include <expected>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ern/common/error.hpp"
#include "ern/model/ern.hpp"
#include "ern/model/parts.hpp"
#include "ern/model/root.hpp"
#include "ern/model/segment.hpp"

namespace ern {

namespace {

constexpr std::size_t kFieldCount = 5;
constexpr std::string_view kScheme = "ern";

// Split on `delim` into at most `max_fields` fields; the last field keeps
// the unsplit remainder.
auto SplitN(std::string_view text, char delim, std::size_t max_fields)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> fields;
  while (fields.size() + 1 < max_fields) {
    auto pos = text.find(delim);
    if (pos == std::string_view::npos) {
      break;
    }
    fields.push_back(text.substr(0, pos));
    text.remove_prefix(pos + 1);
  }
  fields.push_back(text);
  return fields;
}

auto Split(std::string_view text, char delim) -> std::vector<std::string_view> {
  return SplitN(text, delim, std::numeric_limits<std::size_t>::max());
}

auto Reject(std::string_view text, Error error) -> Result<Ern> {
  spdlog::debug("ern: rejected '{}': {}", text, error.message);
  return std::unexpected(std::move(error));
}

}  // namespace

auto ErnParser::Parse() const -> Result<Ern> {
  auto fields = SplitN(text_, ':', kFieldCount);
  if (fields.size() != kFieldCount || fields[0] != kScheme) {
    return Reject(
        text_, Error::InvalidFormat(
                   "Ern", std::format(
                              "'{}' is not of the form "
                              "ern:<domain>:<category>:<account>:<root>",
                              text_)));
  }

  auto domain = Domain::Parse(fields[1]);
  if (!domain) {
    return Reject(text_, std::move(domain).error());
  }
  auto category = Category::Parse(fields[2]);
  if (!category) {
    return Reject(text_, std::move(category).error());
  }
  auto account = Account::Parse(fields[3]);
  if (!account) {
    return Reject(text_, std::move(account).error());
  }

  auto root_and_path = SplitN(fields[4], '/', 2);
  auto root = Root::Parse(root_and_path[0]);
  if (!root) {
    return Reject(text_, std::move(root).error());
  }

  Parts parts;
  if (root_and_path.size() > 1) {
    auto segments = Split(root_and_path[1], '/');
    auto parsed = Parts::FromStrings(segments);
    if (!parsed) {
      return Reject(text_, std::move(parsed).error());
    }
    parts = *std::move(parsed);
  }

  return Ern(
      *std::move(domain), *std::move(category), *std::move(account),
      *std::move(root), std::move(parts));
}

}  // namespace ern
