#pragma once

#include "gmatch/FragmentBuffer.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

namespace gmatch {

// Leaf token types

// Exactly length_ arbitrary characters (merged '?' run).
struct ExactLengthWildcard {
  size_t length_ = 0;

  bool operator==(ExactLengthWildcard const&) const = default;
};

// At least min_length_ arbitrary characters (any run containing '*').
struct MinLengthWildcard {
  size_t min_length_ = 0;

  bool operator==(MinLengthWildcard const&) const = default;
};

struct Literal {
  FragmentBuffer fragments_;

  bool operator==(Literal const&) const = default;
};

// Token wrapper with variant payload
struct Token {
  using Kind = std::variant<ExactLengthWildcard, MinLengthWildcard, Literal>;

  Kind kind_;

  template<typename T>
  [[nodiscard]] bool is() const {
    return std::holds_alternative<T>(kind_);
  }

  template<typename T>
  T const* getIf() const {
    return std::get_if<T>(&kind_);
  }

  template<typename T>
  T* getIf() {
    return std::get_if<T>(&kind_);
  }

  bool operator==(Token const&) const = default;
};

inline bool isWildcard(Token const& t) {
  return !t.is<Literal>();
}

// Number of characters a token consumes at the very least.
inline size_t minLength(Token const& t) {
  return std::visit(
      [](auto const& v) -> size_t {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, ExactLengthWildcard>) {
          return v.length_;
        } else if constexpr (std::is_same_v<V, MinLengthWildcard>) {
          return v.min_length_;
        } else {
          return v.fragments_.combined_length();
        }
      },
      t.kind_);
}

// Helpers to get a printable representation for diagnostics
inline std::string tokenText(Token const& t) {
  return std::visit(
      [](auto const& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, ExactLengthWildcard>) {
          return fmt::format("ExactLengthWildcard({})", v.length_);
        } else if constexpr (std::is_same_v<V, MinLengthWildcard>) {
          return fmt::format("MinLengthWildcard({})", v.min_length_);
        } else {
          return fmt::format("Literal(\"{}\")", v.fragments_.to_string());
        }
      },
      t.kind_);
}

} // namespace gmatch

template<>
struct fmt::formatter<gmatch::Token> : fmt::formatter<std::string_view> {
  template<typename FormatContext>
  auto format(gmatch::Token const& t, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(gmatch::tokenText(t), ctx);
  }
};
