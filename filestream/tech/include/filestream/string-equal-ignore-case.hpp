#pragma once

#include <cstddef>
#include <string_view>

namespace filestream {

// Lowercases ASCII letters, other bytes are returned unchanged.
constexpr char AsciiToLower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (AsciiToLower(*pLhs) != AsciiToLower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

struct CaseInsensitiveHashFunc {
  using is_transparent = void;

  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 0;
    for (char ch : str) {
      hash ^= static_cast<std::size_t>(AsciiToLower(ch)) + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) +
              (hash << 6) + (hash >> 2);
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace filestream
