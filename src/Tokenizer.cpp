#include "gmatch/Tokenizer.hpp"

#include <algorithm>
#include <expected>
#include <string_view>
#include <utility>

namespace gmatch {

namespace {

// Byte length of the UTF-8 sequence introduced by lead; stray bytes count as one.
size_t utf8SequenceLength(unsigned char lead) noexcept {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead >> 5) == 0x06) {
    return 2;
  }
  if ((lead >> 4) == 0x0E) {
    return 3;
  }
  if ((lead >> 3) == 0x1E) {
    return 4;
  }
  return 1;
}

} // namespace

Tokenizer::Tokenizer(std::string_view src) noexcept
    : src_(src) {}

auto Tokenizer::tokenize() -> std::expected<std::vector<Token>, ParseError> {
  out_.clear();
  state_ = State::ExpectNew;

  for (pos_ = 0; pos_ < src_.size(); ++pos_) {
    char c = src_[pos_];
    switch (c) {
      case '*':
      case '?':
        switch (state_) {
          case State::ExpectNew:
            appendWildcard(wildcardFor(c));
            break;
          case State::BorrowedLiteral:
            flushRun();
            appendWildcard(wildcardFor(c));
            state_ = State::ExpectNew;
            break;
          case State::ExpectEscaped:
            startRun(pos_);
            break;
        }
        break;
      case '\\':
        switch (state_) {
          case State::ExpectNew:
            state_ = State::ExpectEscaped;
            break;
          case State::BorrowedLiteral:
            flushRun();
            state_ = State::ExpectEscaped;
            break;
          case State::ExpectEscaped:
            startRun(pos_);
            break;
        }
        break;
      default:
        switch (state_) {
          case State::ExpectNew:
            startRun(pos_);
            break;
          case State::BorrowedLiteral:
            run_end_ = pos_ + 1;
            break;
          case State::ExpectEscaped:
            return std::unexpected(unknownEscape(pos_ - 1));
        }
        break;
    }
  }

  switch (state_) {
    case State::ExpectNew:
      break;
    case State::BorrowedLiteral:
      flushRun();
      break;
    case State::ExpectEscaped:
      return std::unexpected(ParseError::unterminated_escape_sequence(src_.size() - 1));
  }

  state_ = State::ExpectNew;
  return std::move(out_);
}

void Tokenizer::startRun(size_t index) noexcept {
  run_start_ = index;
  run_end_   = index + 1;
  state_     = State::BorrowedLiteral;
}

void Tokenizer::flushRun() {
  appendLiteral(src_.substr(run_start_, run_end_ - run_start_));
}

void Tokenizer::appendWildcard(Token wildcard) {
  if (out_.empty() || out_.back().is<Literal>()) {
    out_.push_back(std::move(wildcard));
    return;
  }
  out_.back() = mergeWildcards(out_.back(), wildcard);
}

void Tokenizer::appendLiteral(std::string_view literal) {
  if (!out_.empty()) {
    if (auto* last = out_.back().getIf<Literal>()) {
      last->fragments_.append(literal);
      return;
    }
  }
  out_.push_back(Token{Literal{FragmentBuffer{literal}}});
}

auto Tokenizer::unknownEscape(size_t backslash) const -> ParseError {
  auto escaped = static_cast<unsigned char>(src_[backslash + 1]);
  auto length  = std::min(1 + utf8SequenceLength(escaped), src_.size() - backslash);
  return ParseError::unknown_escape_sequence(backslash, src_.substr(backslash, length));
}

auto Tokenizer::wildcardFor(char c) noexcept -> Token {
  if (c == '?') {
    return Token{ExactLengthWildcard{1}};
  }
  return Token{MinLengthWildcard{0}};
}

auto Tokenizer::mergeWildcards(Token const& first, Token const& second) noexcept -> Token {
  auto const* a = first.getIf<ExactLengthWildcard>();
  auto const* b = second.getIf<ExactLengthWildcard>();
  if (a != nullptr && b != nullptr) {
    return Token{ExactLengthWildcard{a->length_ + b->length_}};
  }
  return Token{MinLengthWildcard{minLength(first) + minLength(second)}};
}

auto tokenize(std::string_view pattern) -> std::expected<std::vector<Token>, ParseError> {
  return Tokenizer{pattern}.tokenize();
}

} // namespace gmatch
