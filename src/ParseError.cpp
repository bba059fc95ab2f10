#include "gmatch/ParseError.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>

namespace gmatch {

namespace {

std::string describe(ParseError::Kind kind, size_t pos, std::string const& text) {
  switch (kind) {
    case ParseError::Kind::UnknownEscapeSequence:
      return fmt::format("unknown escape sequence '{}' at position {}", text, pos);
    case ParseError::Kind::UnterminatedEscapeSequence:
      return fmt::format("unterminated escape sequence at position {}", pos);
  }
  return fmt::format("invalid pattern at position {}", pos);
}

} // namespace

ParseError::ParseError(Kind kind, size_t pos, std::string text)
    : kind_(kind), position_(pos), text_(std::move(text)), message_(describe(kind_, position_, text_)) {}

auto ParseError::unknown_escape_sequence(size_t pos, std::string_view text) -> ParseError {
  return ParseError{Kind::UnknownEscapeSequence, pos, std::string(text)};
}

auto ParseError::unterminated_escape_sequence(size_t pos) -> ParseError {
  return ParseError{Kind::UnterminatedEscapeSequence, pos};
}

ParseError::Kind ParseError::kind() const noexcept {
  return kind_;
}

size_t ParseError::position() const noexcept {
  return position_;
}

std::string const& ParseError::text() const noexcept {
  return text_;
}

std::string const& ParseError::message() const noexcept {
  return message_;
}

bool ParseError::operator==(ParseError const& other) const noexcept {
  return kind_ == other.kind_ && position_ == other.position_ && text_ == other.text_;
}

} // namespace gmatch
