#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "filestream/http-method.hpp"
#include "filestream/http-status-code.hpp"
#include "filestream/string-equal-ignore-case.hpp"

namespace filestream {

class HttpRequest {
 public:
  // Returned by initTrySetHead when the request head is not yet fully received.
  static constexpr http::StatusCode kStatusNeedMoreData = -1;

  enum class Version : uint8_t { HTTP10, HTTP11 };

  using HeadersMap = std::unordered_map<std::string, std::string, CaseInsensitiveHashFunc, CaseInsensitiveEqualFunc>;
  using PathParams = std::vector<std::pair<std::string, std::string>>;

  HttpRequest() = default;

  // Attempts to parse a complete request head (request line + headers + CRLFCRLF) at the start of 'data'.
  // Returns:
  //  - StatusCodeOK on success. headSize() then gives the number of consumed bytes.
  //  - kStatusNeedMoreData if the head is incomplete and still below maxHeaderBytes.
  //  - an HTTP error status code (400, 414, 431, 501, 505) if the head is invalid.
  // Repeated headers are merged with ", ".
  [[nodiscard]] http::StatusCode initTrySetHead(std::string_view data, std::size_t maxHeaderBytes);

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] Version version() const noexcept { return _version; }

  [[nodiscard]] std::string_view versionStr() const noexcept;

  // Percent-decoded path, without query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw query string (without the leading '?'), empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  [[nodiscard]] const HeadersMap& headers() const noexcept { return _headers; }

  // Case-insensitive header lookup.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const {
    return headerValue(name).value_or(std::string_view{});
  }

  // Size of the parsed head in bytes, including the final CRLFCRLF.
  [[nodiscard]] std::size_t headSize() const noexcept { return _headSize; }

  // Value of the 'Content-Length' header, 0 if absent.
  [[nodiscard]] std::size_t contentLength() const noexcept { return _contentLength; }

  // Whether the client asked for the connection to stay open after this request,
  // according to its version and 'Connection' header.
  [[nodiscard]] bool wantsKeepAlive() const;

  // Path parameters captured by the router (pattern '{name}' segments).
  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  [[nodiscard]] std::optional<std::string_view> pathParamValue(std::string_view name) const;

  // Set by the router upon match.
  void setPathParams(PathParams pathParams) { _pathParams = std::move(pathParams); }

 private:
  http::StatusCode parseRequestLine(std::string_view line);
  http::StatusCode parseHeaderLine(std::string_view line);

  std::string _path;
  std::string _query;
  HeadersMap _headers;
  PathParams _pathParams;
  std::size_t _headSize{0};
  std::size_t _contentLength{0};
  http::Method _method{http::Method::GET};
  Version _version{Version::HTTP11};
};

}  // namespace filestream
