#include "gmatch/Matcher.hpp"

#include <span>
#include <string_view>

namespace gmatch::matcher {

auto matches_anchored(std::span<Token const> tokens, std::string_view str) noexcept -> bool {
  if (tokens.empty()) {
    return true;
  }

  Token const& token = tokens.front();
  auto         rest  = tokens.subspan(1);

  if (auto const* exact = token.getIf<ExactLengthWildcard>()) {
    return str.size() >= exact->length_ && matches_anchored(rest, str.substr(exact->length_));
  }
  if (auto const* min = token.getIf<MinLengthWildcard>()) {
    // the wildcard may absorb more than its minimum, so the rest floats
    return str.size() >= min->min_length_ && matches_unanchored(rest, str.substr(min->min_length_));
  }

  auto const& literal = token.getIf<Literal>()->fragments_;
  return literal.matches_prefix_of(str) && matches_anchored(rest, str.substr(literal.combined_length()));
}

auto matches_unanchored(std::span<Token const> tokens, std::string_view str) noexcept -> bool {
  if (tokens.empty()) {
    return true;
  }

  Token const& token = tokens.front();
  auto         rest  = tokens.subspan(1);

  if (isWildcard(token)) {
    auto length = minLength(token);
    return str.size() >= length && matches_unanchored(rest, str.substr(length));
  }

  auto const& literal = token.getIf<Literal>()->fragments_;
  for (auto offset : literal.occurrences_in(str)) {
    if (matches_anchored(rest, str.substr(offset + literal.combined_length()))) {
      return true;
    }
  }
  return false;
}

} // namespace gmatch::matcher
