#pragma once

#include "gmatch/ParseError.hpp"
#include "gmatch/Tokens.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gmatch {

// A parsed glob pattern. '*' matches any run of characters, '?' exactly one,
// and "\*", "\?", "\\" stand for the literal characters.
//
// The pattern text is copied once into shared immutable storage that the
// tokens point into, so instances are independent of the caller's buffer and
// cheap to copy. Instances are never mutated after parse() and may be used
// from several threads at once.
class GlobPattern {
  std::shared_ptr<std::string const> source_;
  std::vector<Token>                 tokens_;
  size_t                             min_match_length_ = 0;

  GlobPattern(std::shared_ptr<std::string const> source, std::vector<Token> tokens) noexcept;

public:
  [[nodiscard]] static auto parse(std::string_view pattern) -> std::expected<GlobPattern, ParseError>;

  // True if the pattern occurs anywhere within candidate.
  [[nodiscard]] auto matches_partially(std::string_view candidate) const -> bool;

  [[nodiscard]] auto source() const noexcept -> std::string_view;
  [[nodiscard]] auto tokens() const noexcept -> std::span<Token const>;

  // Shortest candidate that can possibly match.
  [[nodiscard]] auto min_match_length() const noexcept -> size_t {
    return min_match_length_;
  }
};

[[nodiscard]] auto parse(std::string_view pattern) -> std::expected<GlobPattern, ParseError>;

// Parses pattern and matches it against candidate; nothing is cached between calls.
[[nodiscard]] auto matches_partially(std::string_view pattern, std::string_view candidate)
    -> std::expected<bool, ParseError>;

} // namespace gmatch
