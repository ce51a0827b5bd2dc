#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "filestream/byte-range.hpp"
#include "filestream/cors-policy.hpp"
#include "filestream/http-response.hpp"
#include "filestream/object-metadata.hpp"

namespace filestream {

// How a client should present a streamed object.
enum class Disposition : std::uint8_t { Inline, Attachment };

[[nodiscard]] std::string_view DispositionToStr(Disposition disposition) noexcept;

// CORS policy applied to all media and API responses:
//   Access-Control-Allow-Origin: *
//   Access-Control-Allow-Methods: GET, POST, OPTIONS, HEAD
//   Access-Control-Allow-Headers: Content-Type, Range, User-Agent, X-Requested-With
//   Access-Control-Expose-Headers: Content-Length, Content-Range, Content-Disposition
//   Access-Control-Max-Age: 86400
[[nodiscard]] const CorsPolicy& MediaCorsPolicy();

// 'Content-Disposition' value: <inline|attachment>; filename="<fileName>"
// CR and LF are removed from the file name, '"' and '\' are escaped.
[[nodiscard]] std::string BuildContentDisposition(Disposition disposition, std::string_view fileName);

// Head of a successful media response for given range, without body stream.
// Status is 206 if 'partial' (the request carried a Range header), 200 otherwise. Both carry 'Content-Range'.
// 'Content-Length' is declared as the range length.
[[nodiscard]] HttpResponse BuildStreamResponse(const ByteRange& range, const ObjectMetadata& metadata,
                                               Disposition disposition, bool partial);

// 416 response for an object of totalSize bytes, with 'Content-Range: bytes */<totalSize>'.
[[nodiscard]] HttpResponse BuildRangeNotSatisfiable(std::uint64_t totalSize);

}  // namespace filestream
