#include "filestream/byte-range.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "filestream/string-equal-ignore-case.hpp"
#include "filestream/string-trim.hpp"
#include "filestream/stringconv.hpp"

namespace filestream {

namespace {

constexpr std::string_view kBytesEqual = "bytes=";

RangeSelection Make(RangeSelection::State state, std::uint64_t from = 0, std::uint64_t until = 0,
                    std::uint64_t total = 0) {
  return RangeSelection{state, ByteRange{from, until, total}};
}

}  // namespace

RangeSelection ParseRange(std::optional<std::string_view> rangeHeader, std::uint64_t totalSize) {
  std::string_view raw = rangeHeader ? TrimOws(*rangeHeader) : std::string_view{};
  if (raw.empty()) {
    if (totalSize == 0) {
      return Make(RangeSelection::State::Unsatisfiable, 0, 0, totalSize);
    }
    return Make(RangeSelection::State::Full, 0, totalSize - 1U, totalSize);
  }

  if (!StartsWithCaseInsensitive(raw, kBytesEqual)) {
    return Make(RangeSelection::State::Invalid, 0, 0, totalSize);
  }
  raw.remove_prefix(kBytesEqual.size());
  if (raw.contains(',')) {
    // multipart/byteranges is not supported
    return Make(RangeSelection::State::Invalid, 0, 0, totalSize);
  }
  const auto dashPos = raw.find('-');
  if (dashPos == std::string_view::npos) {
    return Make(RangeSelection::State::Invalid, 0, 0, totalSize);
  }

  const auto firstPart = TrimOws(raw.substr(0, dashPos));
  const auto secondPart = TrimOws(raw.substr(dashPos + 1));

  // 'from' is mandatory: suffix ranges (bytes=-N) are rejected, as are signs and any non digit.
  const auto from = TryStringToIntegral<std::uint64_t>(firstPart);
  if (!from) {
    return Make(RangeSelection::State::Invalid, 0, 0, totalSize);
  }
  std::uint64_t until;
  if (secondPart.empty()) {
    if (totalSize == 0) {
      return Make(RangeSelection::State::Unsatisfiable, 0, 0, totalSize);
    }
    until = totalSize - 1U;
  } else {
    const auto optUntil = TryStringToIntegral<std::uint64_t>(secondPart);
    if (!optUntil) {
      return Make(RangeSelection::State::Invalid, 0, 0, totalSize);
    }
    until = *optUntil;
  }

  if (until >= totalSize || until < *from) {
    return Make(RangeSelection::State::Unsatisfiable, *from, until, totalSize);
  }
  return Make(RangeSelection::State::Partial, *from, until, totalSize);
}

std::string BuildContentRange(const ByteRange& range) {
  std::string ret(kBytesEqual.substr(0, kBytesEqual.size() - 1U));
  ret.push_back(' ');
  ret.append(IntegralToString(range.from));
  ret.push_back('-');
  ret.append(IntegralToString(range.until));
  ret.push_back('/');
  ret.append(IntegralToString(range.total));
  return ret;
}

std::string BuildUnsatisfiedContentRange(std::uint64_t totalSize) {
  std::string ret("bytes */");
  ret.append(IntegralToString(totalSize));
  return ret;
}

std::string_view RangeSelectionStateToStr(RangeSelection::State state) noexcept {
  switch (state) {
    case RangeSelection::State::Full:
      return "full";
    case RangeSelection::State::Partial:
      return "partial";
    case RangeSelection::State::Invalid:
      return "invalid";
    case RangeSelection::State::Unsatisfiable:
      return "unsatisfiable";
  }
  return "unknown";
}

}  // namespace filestream
