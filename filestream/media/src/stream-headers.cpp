#include "filestream/stream-headers.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "filestream/byte-range.hpp"
#include "filestream/cors-policy.hpp"
#include "filestream/http-constants.hpp"
#include "filestream/http-method.hpp"
#include "filestream/http-response.hpp"
#include "filestream/http-status-code.hpp"
#include "filestream/object-metadata.hpp"

namespace filestream {

namespace {

constexpr std::string_view kRangeNotSatisfiableBody = "416: Range not satisfiable";

CorsPolicy MakeMediaCorsPolicy() {
  CorsPolicy policy;
  policy.allowAnyOrigin()
      .allowMethod(http::Method::GET)
      .allowMethod(http::Method::POST)
      .allowMethod(http::Method::OPTIONS)
      .allowMethod(http::Method::HEAD)
      .allowRequestHeader(http::ContentType)
      .allowRequestHeader(http::Range)
      .allowRequestHeader(http::UserAgent)
      .allowRequestHeader(http::XRequestedWith)
      .exposeHeader(http::ContentLength)
      .exposeHeader(http::ContentRange)
      .exposeHeader(http::ContentDisposition)
      .maxAge(std::chrono::hours{24});
  return policy;
}

}  // namespace

std::string_view DispositionToStr(Disposition disposition) noexcept {
  return disposition == Disposition::Attachment ? "attachment" : "inline";
}

const CorsPolicy& MediaCorsPolicy() {
  static const CorsPolicy kPolicy = MakeMediaCorsPolicy();
  return kPolicy;
}

std::string BuildContentDisposition(Disposition disposition, std::string_view fileName) {
  std::string ret(DispositionToStr(disposition));
  ret.append("; filename=\"");
  for (const char ch : fileName) {
    switch (ch) {
      case '\r':
        [[fallthrough]];
      case '\n':
        break;
      case '"':
        [[fallthrough]];
      case '\\':
        ret.push_back('\\');
        ret.push_back(ch);
        break;
      default:
        ret.push_back(ch);
        break;
    }
  }
  ret.push_back('"');
  return ret;
}

HttpResponse BuildStreamResponse(const ByteRange& range, const ObjectMetadata& metadata, Disposition disposition,
                                 bool partial) {
  HttpResponse response(partial ? http::StatusCodePartialContent : http::StatusCodeOK);
  MediaCorsPolicy().applyTo(response);
  response.header(http::ContentType, metadata.mimeType)
      .header(http::ContentRange, BuildContentRange(range))
      .contentLength(range.length())
      .header(http::ContentDisposition, BuildContentDisposition(disposition, metadata.name))
      .header(http::AcceptRanges, http::bytes);
  return response;
}

HttpResponse BuildRangeNotSatisfiable(std::uint64_t totalSize) {
  HttpResponse response(http::StatusCodeRangeNotSatisfiable, kRangeNotSatisfiableBody);
  MediaCorsPolicy().applyTo(response);
  response.header(http::ContentRange, BuildUnsatisfiedContentRange(totalSize)).header(http::AcceptRanges, http::bytes);
  return response;
}

}  // namespace filestream
