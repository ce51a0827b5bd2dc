#pragma once

#include <array>
#include <charconv>
#include <concepts>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "filestream/log.hpp"

namespace filestream {

template <std::integral Integral>
std::string IntegralToString(Integral val) {
  // +1 for minus, +1 for additional partial ranges coverage
  static constexpr auto kMaxSize =
      std::numeric_limits<Integral>::digits10 + 1 + static_cast<int>(std::is_signed_v<Integral>);

  std::array<char, kMaxSize> buf;
  // no need to check the return value here, it cannot fail as we sized the buffer accordingly
  const auto [ptr, errc] = std::to_chars(buf.data(), buf.data() + buf.size(), val);
  return {buf.data(), ptr};
}

// Strict decimal parsing: the whole token must be consumed, no sign and no surrounding spaces.
template <std::integral Integral>
[[nodiscard]] std::optional<Integral> TryStringToIntegral(std::string_view str) noexcept {
  if (str.empty() || str.front() == '+' || str.front() == '-') {
    return std::nullopt;
  }
  Integral ret;
  const char* endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret);
  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

template <std::integral Integral>
Integral StringToIntegral(std::string_view str) {
  const auto ret = TryStringToIntegral<Integral>(str);
  if (!ret) {
    log::critical("Unable to decode '{}' into integral", str);
    throw std::invalid_argument("StringToIntegral conversion failed");
  }
  return *ret;
}

}  // namespace filestream
