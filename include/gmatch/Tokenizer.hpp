#pragma once

#include "gmatch/ParseError.hpp"
#include "gmatch/Tokens.hpp"

#include <cstddef>
#include <expected>
#include <string_view>
#include <vector>

namespace gmatch {

// Single pass over a glob pattern. Literal tokens borrow views into src, so the
// pattern text has to outlive the returned tokens.
class Tokenizer {
  enum struct State {
    ExpectNew,
    BorrowedLiteral, // run is src_[run_start_, run_end_)
    ExpectEscaped
  };

  std::string_view   src_;
  size_t             pos_       = 0;
  State              state_     = State::ExpectNew;
  size_t             run_start_ = 0;
  size_t             run_end_   = 0;
  std::vector<Token> out_;

public:
  explicit Tokenizer(std::string_view src) noexcept;

  Tokenizer(Tokenizer const&)                = delete;
  Tokenizer& operator=(Tokenizer const&)     = delete;
  Tokenizer(Tokenizer&&) noexcept            = default;
  Tokenizer& operator=(Tokenizer&&) noexcept = default;
  ~Tokenizer()                               = default;

  [[nodiscard]] auto tokenize() -> std::expected<std::vector<Token>, ParseError>;

private:
  void startRun(size_t index) noexcept;
  void flushRun();
  void appendWildcard(Token wildcard);
  void appendLiteral(std::string_view literal);

  [[nodiscard]] auto unknownEscape(size_t backslash) const -> ParseError;

  [[nodiscard]] static auto wildcardFor(char c) noexcept -> Token;
  [[nodiscard]] static auto mergeWildcards(Token const& first, Token const& second) noexcept -> Token;
};

auto tokenize(std::string_view pattern) -> std::expected<std::vector<Token>, ParseError>;

} // namespace gmatch
