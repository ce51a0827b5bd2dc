#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace filestream {

// Closed byte interval [from, until] of an object of 'total' bytes.
// Invariant for ranges produced by ParseRange: from <= until < total.
struct ByteRange {
  [[nodiscard]] constexpr std::uint64_t length() const noexcept { return until - from + 1U; }

  bool operator==(const ByteRange&) const noexcept = default;

  std::uint64_t from{};
  std::uint64_t until{};
  std::uint64_t total{};
};

struct RangeSelection {
  // Full          : no (or empty) Range header, range covers the whole object (rendered as 200)
  // Partial       : single satisfiable 'bytes=' range (rendered as 206)
  // Invalid       : malformed header (syntax error, multiple ranges, non numeric tokens)
  // Unsatisfiable : well formed, but outside of [0, total)
  enum class State : std::uint8_t { Full, Partial, Invalid, Unsatisfiable };

  [[nodiscard]] bool satisfiable() const noexcept { return state == State::Full || state == State::Partial; }

  State state{State::Full};
  ByteRange range;
};

// Parses the value of a 'Range' request header against an object of totalSize bytes.
// Only the single range form 'bytes=<from>-[<until>]' is accepted ('until' defaults to totalSize - 1).
// An object of size 0 has no satisfiable range, even without Range header.
[[nodiscard]] RangeSelection ParseRange(std::optional<std::string_view> rangeHeader, std::uint64_t totalSize);

// Builds a 'Content-Range' value for a satisfied range: "bytes <from>-<until>/<total>"
[[nodiscard]] std::string BuildContentRange(const ByteRange& range);

// Builds a 'Content-Range' value for a 416 response: "bytes */<total>"
[[nodiscard]] std::string BuildUnsatisfiedContentRange(std::uint64_t totalSize);

[[nodiscard]] std::string_view RangeSelectionStateToStr(RangeSelection::State state) noexcept;

}  // namespace filestream
