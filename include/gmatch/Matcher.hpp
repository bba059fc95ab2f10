#pragma once

#include "gmatch/Tokens.hpp"

#include <span>
#include <string_view>

namespace gmatch::matcher {

// The token sequence has to start matching at offset 0 of str. Characters left
// over after the last token are allowed.
[[nodiscard]] auto matches_anchored(std::span<Token const> tokens, std::string_view str) noexcept -> bool;

// The token sequence may start matching at any offset of str.
[[nodiscard]] auto matches_unanchored(std::span<Token const> tokens, std::string_view str) noexcept -> bool;

} // namespace gmatch::matcher
