#pragma once

#include <bit>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>

namespace filestream::http {

enum class Method : uint8_t {
  GET = 1U << 0,
  HEAD = 1U << 1,
  POST = 1U << 2,
  PUT = 1U << 3,
  DELETE = 1U << 4,
  OPTIONS = 1U << 5,
  PATCH = 1U << 6,
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 7;

using MethodBmp = uint8_t;

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(static_cast<MethodBmp>(lhs) | static_cast<MethodBmp>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(lhs | static_cast<MethodBmp>(rhs));
}

constexpr bool IsMethodSet(MethodBmp mask, Method method) { return (mask & static_cast<MethodBmp>(method)) != 0U; }

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodBmp>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET", "HEAD", "POST", "PUT", "DELETE", "OPTIONS", "PATCH"};

static_assert(std::size(kMethodStrings) == kNbMethods);

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Parse a method token (case sensitive, as per RFC 9110).
[[nodiscard]] std::optional<Method> MethodStrToOptEnum(std::string_view str) noexcept;

}  // namespace filestream::http
