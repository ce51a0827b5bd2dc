#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "filestream/http-method.hpp"
#include "filestream/http-response.hpp"

namespace filestream {

// Static CORS policy: the same set of Access-Control-* headers is emitted on every response it is applied to,
// whatever the request origin. Values are emitted in insertion order.
class CorsPolicy {
 public:
  CorsPolicy() = default;

  // Access-Control-Allow-Origin: *
  CorsPolicy& allowAnyOrigin();

  // Access-Control-Allow-Origin: <origin>
  CorsPolicy& allowOrigin(std::string_view origin);

  // Append a method to Access-Control-Allow-Methods.
  CorsPolicy& allowMethod(http::Method method);

  // Append a header name to Access-Control-Allow-Headers (case-insensitive deduplication).
  CorsPolicy& allowRequestHeader(std::string_view header);

  // Append a header name to Access-Control-Expose-Headers (case-insensitive deduplication).
  CorsPolicy& exposeHeader(std::string_view header);

  // Set Access-Control-Max-Age. Throws std::invalid_argument if negative.
  CorsPolicy& maxAge(std::chrono::seconds maxAge);

  // Sets the Access-Control-* headers on given response.
  void applyTo(HttpResponse& response) const;

  // Response to a preflight (OPTIONS) request: 200, CORS headers, empty body.
  [[nodiscard]] HttpResponse preflightResponse() const;

  [[nodiscard]] std::string_view allowedOrigin() const noexcept { return _allowedOrigin; }
  [[nodiscard]] std::string_view allowedMethods() const noexcept { return _allowedMethods; }
  [[nodiscard]] std::string_view allowedRequestHeaders() const noexcept { return _allowedRequestHeaders; }
  [[nodiscard]] std::string_view exposedHeaders() const noexcept { return _exposedHeaders; }

 private:
  std::string _allowedOrigin;
  std::string _allowedMethods;
  std::string _allowedRequestHeaders;
  std::string _exposedHeaders;
  std::chrono::seconds _maxAge{-1};
};

}  // namespace filestream
