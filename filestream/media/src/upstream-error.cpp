#include "filestream/upstream-error.hpp"

#include <string_view>

#include "filestream/media-payload.hpp"

namespace filestream {

std::string_view UpstreamErrorKindToStr(UpstreamErrorKind kind) noexcept {
  switch (kind) {
    case UpstreamErrorKind::RateLimited:
      return "rate-limited";
    case UpstreamErrorKind::OffsetInvalid:
      return "offset-invalid";
    case UpstreamErrorKind::Protocol:
      return "protocol";
    case UpstreamErrorKind::TransportIo:
      return "transport-io";
    case UpstreamErrorKind::Other:
      return "other";
  }
  return "unknown";
}

std::string_view MediaKindToStr(MediaKind kind) noexcept {
  switch (kind) {
    case MediaKind::Video:
      return "video";
    case MediaKind::Audio:
      return "audio";
    case MediaKind::Document:
      return "document";
    case MediaKind::Animation:
      return "animation";
  }
  return "unknown";
}

}  // namespace filestream
