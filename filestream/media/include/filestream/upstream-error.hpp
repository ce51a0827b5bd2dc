#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace filestream {

enum class UpstreamErrorKind : std::uint8_t {
  RateLimited,    // upstream asked to back off
  OffsetInvalid,  // requested offset rejected by upstream
  Protocol,       // upstream replied with an error (unknown message, malformed reply...)
  TransportIo,    // connection reset, broken pipe, I/O error
  Other
};

[[nodiscard]] std::string_view UpstreamErrorKindToStr(UpstreamErrorKind kind) noexcept;

// Error raised by an UpstreamSource or a ChunkReader.
class UpstreamError : public std::runtime_error {
 public:
  UpstreamError(UpstreamErrorKind kind, const std::string& what) : std::runtime_error(what), _kind(kind) {}

  [[nodiscard]] UpstreamErrorKind kind() const noexcept { return _kind; }

  // Whether the error belongs to the known failure classes of an upstream (every kind but Other).
  [[nodiscard]] bool isExpected() const noexcept { return _kind != UpstreamErrorKind::Other; }

 private:
  UpstreamErrorKind _kind;
};

}  // namespace filestream
