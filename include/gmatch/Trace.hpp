#pragma once

#include <cstdio>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace gmatch::trace {

inline constexpr std::string_view TRACE_ENV_VAR = "GMATCH_TRACE";

// "1", "true", "on" and "yes" (any case) enable tracing; everything else disables it.
[[nodiscard]] auto parse_flag(std::optional<std::string_view> value) noexcept -> bool;

// Reads GMATCH_TRACE once, unless set_enabled() was called before.
[[nodiscard]] auto enabled() noexcept -> bool;
void               set_enabled(bool on) noexcept;

template<typename... Args>
void log(fmt::format_string<Args...> format, Args&&... args) {
  if (!enabled()) {
    return;
  }
  fmt::print(stderr, "[gmatch] {}\n", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace gmatch::trace
