#include "gmatch/Trace.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace gmatch::trace {

namespace {

std::optional<std::string_view> readEnv() noexcept {
  if (char const* value = std::getenv(TRACE_ENV_VAR.data())) {
    return std::string_view{value};
  }
  return std::nullopt;
}

std::atomic<bool>& flag() noexcept {
  static std::atomic<bool> flag{parse_flag(readEnv())};
  return flag;
}

} // namespace

auto parse_flag(std::optional<std::string_view> value) noexcept -> bool {
  if (!value || value->empty() || value->size() > 4) {
    return false;
  }

  std::array<char, 4> lowered{};
  std::transform(value->begin(), value->end(), lowered.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  std::string_view word{lowered.data(), value->size()};

  return word == "1" || word == "true" || word == "on" || word == "yes";
}

auto enabled() noexcept -> bool {
  return flag().load(std::memory_order_relaxed);
}

void set_enabled(bool on) noexcept {
  flag().store(on, std::memory_order_relaxed);
}

} // namespace gmatch::trace
