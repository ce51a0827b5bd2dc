#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "filestream/chunk-generator.hpp"
#include "filestream/http-constants.hpp"
#include "filestream/http-header.hpp"
#include "filestream/http-status-code.hpp"

namespace filestream {

// HTTP response built by handlers, with fluent setters usable on lvalues and temporaries.
//
// The body is either inline (body()) or streamed (bodyStream()). A streamed body requires an explicit
// length declared with contentLength(), because the server frames it with a 'Content-Length' header and
// does not use chunked transfer encoding.
// 'Content-Length' of inline bodies is computed at serialization time.
class HttpResponse {
 public:
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK) : _statusCode(code) {}

  HttpResponse(http::StatusCode code, std::string_view body,
               std::string_view contentType = http::ContentTypeTextPlain)
      : _statusCode(code) {
    this->body(std::string(body), contentType);
  }

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  HttpResponse& status(http::StatusCode code) & noexcept {
    _statusCode = code;
    return *this;
  }

  HttpResponse&& status(http::StatusCode code) && noexcept { return std::move(status(code)); }

  // Sets the header, replacing all previous values for the same name (case-insensitive).
  HttpResponse& header(std::string_view name, std::string_view value) &;

  HttpResponse&& header(std::string_view name, std::string_view value) && {
    return std::move(header(name, value));
  }

  // Appends a header line, without checking for previous values.
  HttpResponse& addHeader(std::string_view name, std::string_view value) &;

  HttpResponse&& addHeader(std::string_view name, std::string_view value) && {
    return std::move(addHeader(name, value));
  }

  // Returns the value of the first header with given name (case-insensitive).
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  // Sets an inline body, and its 'Content-Type' if contentType is not empty.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) &;

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    return std::move(this->body(std::move(body), contentType));
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Declares the length of a streamed body, and sets the 'Content-Length' header accordingly.
  HttpResponse& contentLength(std::uint64_t length) &;

  HttpResponse&& contentLength(std::uint64_t length) && { return std::move(contentLength(length)); }

  [[nodiscard]] std::optional<std::uint64_t> declaredContentLength() const noexcept { return _declaredLength; }

  // Attaches a lazily produced body. The generator is pulled by the server only when the socket
  // has accepted all previously produced bytes.
  HttpResponse& bodyStream(ChunkGenerator generator) &;

  HttpResponse&& bodyStream(ChunkGenerator generator) && { return std::move(bodyStream(std::move(generator))); }

  [[nodiscard]] bool hasBodyStream() const noexcept { return _bodyStream.valid(); }

  [[nodiscard]] ChunkGenerator extractBodyStream() noexcept { return std::move(_bodyStream); }

  // Serializes the status line and the headers, ending with an empty line.
  // 'globalHeaders' are added unless the response already defines them.
  // 'Connection: close' is emitted when keepAlive is false, 'Connection: keep-alive' for HTTP/1.0 keep-alive.
  [[nodiscard]] std::string serializeHead(std::string_view version, bool keepAlive,
                                          std::span<const http::Header> globalHeaders,
                                          std::string_view date) const;

 private:
  void eraseHeader(std::string_view name) noexcept;

  std::vector<http::Header> _headers;
  std::string _body;
  ChunkGenerator _bodyStream;
  std::optional<std::uint64_t> _declaredLength;
  http::StatusCode _statusCode;
};

}  // namespace filestream
