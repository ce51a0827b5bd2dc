#include "filestream/cors-policy.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

#include "filestream/http-constants.hpp"
#include "filestream/http-method.hpp"
#include "filestream/http-response.hpp"
#include "filestream/http-status-code.hpp"
#include "filestream/string-equal-ignore-case.hpp"
#include "filestream/string-trim.hpp"
#include "filestream/stringconv.hpp"

namespace filestream {
namespace {

std::string_view NextCsvToken(std::string_view& csv) {
  const auto commaPos = csv.find(',');
  const std::string_view token = commaPos == std::string_view::npos ? csv : csv.substr(0, commaPos);
  if (commaPos == std::string_view::npos) {
    csv = {};
  } else {
    csv.remove_prefix(commaPos + 1);
  }
  return TrimOws(token);
}

bool ListContainsToken(std::string_view list, std::string_view token) {
  while (!list.empty()) {
    const auto part = NextCsvToken(list);
    if (!part.empty() && CaseInsensitiveEqual(part, token)) {
      return true;
    }
  }
  return false;
}

void AppendUniqueToken(std::string& list, std::string_view token) {
  token = TrimOws(token);
  if (token.empty() || ListContainsToken(list, token)) {
    return;
  }
  if (!list.empty()) {
    list.append(", ");
  }
  list.append(token);
}

}  // namespace

CorsPolicy& CorsPolicy::allowAnyOrigin() {
  _allowedOrigin = "*";
  return *this;
}

CorsPolicy& CorsPolicy::allowOrigin(std::string_view origin) {
  _allowedOrigin = TrimOws(origin);
  return *this;
}

CorsPolicy& CorsPolicy::allowMethod(http::Method method) {
  AppendUniqueToken(_allowedMethods, http::MethodToStr(method));
  return *this;
}

CorsPolicy& CorsPolicy::allowRequestHeader(std::string_view header) {
  AppendUniqueToken(_allowedRequestHeaders, header);
  return *this;
}

CorsPolicy& CorsPolicy::exposeHeader(std::string_view header) {
  AppendUniqueToken(_exposedHeaders, header);
  return *this;
}

CorsPolicy& CorsPolicy::maxAge(std::chrono::seconds maxAge) {
  if (maxAge < std::chrono::seconds{0}) {
    throw std::invalid_argument("maxAge must be non-negative");
  }
  _maxAge = maxAge;
  return *this;
}

void CorsPolicy::applyTo(HttpResponse& response) const {
  if (!_allowedOrigin.empty()) {
    response.header(http::AccessControlAllowOrigin, _allowedOrigin);
  }
  if (!_allowedMethods.empty()) {
    response.header(http::AccessControlAllowMethods, _allowedMethods);
  }
  if (!_allowedRequestHeaders.empty()) {
    response.header(http::AccessControlAllowHeaders, _allowedRequestHeaders);
  }
  if (!_exposedHeaders.empty()) {
    response.header(http::AccessControlExposeHeaders, _exposedHeaders);
  }
  if (_maxAge.count() >= 0) {
    response.header(http::AccessControlMaxAge, IntegralToString(_maxAge.count()));
  }
}

HttpResponse CorsPolicy::preflightResponse() const {
  HttpResponse response(http::StatusCodeOK);
  applyTo(response);
  return response;
}

}  // namespace filestream
