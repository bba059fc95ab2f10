#include "gmatch/GlobPattern.hpp"

#include "gmatch/Matcher.hpp"
#include "gmatch/Tokenizer.hpp"
#include "gmatch/Trace.hpp"

#include <expected>
#include <memory>
#include <numeric>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace gmatch {

GlobPattern::GlobPattern(std::shared_ptr<std::string const> source, std::vector<Token> tokens) noexcept
    : source_(std::move(source)), tokens_(std::move(tokens)) {
  min_match_length_ = std::accumulate(tokens_.begin(), tokens_.end(), size_t{0}, [](size_t sum, Token const& t) {
    return sum + minLength(t);
  });
}

auto GlobPattern::parse(std::string_view pattern) -> std::expected<GlobPattern, ParseError> {
  std::shared_ptr<std::string const> source = std::make_shared<std::string>(pattern);

  auto tokens = Tokenizer{*source}.tokenize();
  if (!tokens) {
    trace::log("parse \"{}\": {}", pattern, tokens.error().message());
    return std::unexpected(std::move(tokens.error()));
  }

  trace::log("parse \"{}\": [{}]", pattern, fmt::join(*tokens, ", "));
  return GlobPattern{std::move(source), std::move(*tokens)};
}

auto GlobPattern::matches_partially(std::string_view candidate) const -> bool {
  bool matched = candidate.size() >= min_match_length_ && matcher::matches_unanchored(tokens_, candidate);
  trace::log("match \"{}\" against \"{}\": {}", *source_, candidate, matched);
  return matched;
}

auto GlobPattern::source() const noexcept -> std::string_view {
  return *source_;
}

auto GlobPattern::tokens() const noexcept -> std::span<Token const> {
  return tokens_;
}

auto parse(std::string_view pattern) -> std::expected<GlobPattern, ParseError> {
  return GlobPattern::parse(pattern);
}

auto matches_partially(std::string_view pattern, std::string_view candidate) -> std::expected<bool, ParseError> {
  auto glob = GlobPattern::parse(pattern);
  if (!glob) {
    return std::unexpected(std::move(glob.error()));
  }
  return glob->matches_partially(candidate);
}

} // namespace gmatch
