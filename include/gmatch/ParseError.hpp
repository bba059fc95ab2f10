#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gmatch {

struct ParseError {
  enum struct Kind {
    UnknownEscapeSequence,     // backslash followed by something other than '*', '?' or '\'
    UnterminatedEscapeSequence // backslash at the end of the pattern
  };

  Kind        kind_;
  size_t      position_; // byte offset of the offending backslash
  std::string text_;     // offending escape sequence, empty when unterminated
  std::string message_;

  ParseError(Kind kind, size_t pos, std::string text = "");

  ParseError(ParseError const&)                = default;
  ParseError& operator=(ParseError const&)     = default;
  ParseError(ParseError&&) noexcept            = default;
  ParseError& operator=(ParseError&&) noexcept = default;
  ~ParseError()                                = default;

  [[nodiscard]] static auto unknown_escape_sequence(size_t pos, std::string_view text) -> ParseError;
  [[nodiscard]] static auto unterminated_escape_sequence(size_t pos) -> ParseError;

  [[nodiscard]] Kind               kind() const noexcept;
  [[nodiscard]] size_t             position() const noexcept;
  [[nodiscard]] std::string const& text() const noexcept;
  [[nodiscard]] std::string const& message() const noexcept;

  [[nodiscard]] bool operator==(ParseError const& other) const noexcept;
};

} // namespace gmatch
