#include "filestream/http-request.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "filestream/http-constants.hpp"
#include "filestream/http-method.hpp"
#include "filestream/http-status-code.hpp"
#include "filestream/string-equal-ignore-case.hpp"
#include "filestream/string-trim.hpp"
#include "filestream/stringconv.hpp"

namespace filestream {

namespace {

constexpr std::size_t kMaxRequestTargetLen = 4096;

int HexValue(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

// Percent-decodes given path. Returns false on invalid escape sequences.
bool UrlDecodePath(std::string_view encoded, std::string& out) {
  out.clear();
  out.reserve(encoded.size());
  for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    if (ch != '%') {
      out.push_back(ch);
      continue;
    }
    if (pos + 2 >= encoded.size()) {
      return false;
    }
    const int hi = HexValue(encoded[pos + 1]);
    const int lo = HexValue(encoded[pos + 2]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    pos += 2;
  }
  return true;
}

bool IsTokenChar(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         std::string_view("!#$%&'*+-.^_`|~").contains(ch);
}

}  // namespace

http::StatusCode HttpRequest::initTrySetHead(std::string_view data, std::size_t maxHeaderBytes) {
  const auto headEnd = data.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return data.size() > maxHeaderBytes ? http::StatusCodeRequestHeaderFieldsTooLarge : kStatusNeedMoreData;
  }
  _headSize = headEnd + http::DoubleCRLF.size();
  if (_headSize > maxHeaderBytes) {
    return http::StatusCodeRequestHeaderFieldsTooLarge;
  }

  _headers.clear();
  _pathParams.clear();
  _contentLength = 0;

  std::string_view head = data.substr(0, headEnd + http::CRLF.size());
  auto lineEnd = head.find(http::CRLF);
  const auto status = parseRequestLine(head.substr(0, lineEnd));
  if (status != http::StatusCodeOK) {
    return status;
  }
  head.remove_prefix(lineEnd + http::CRLF.size());

  while (!head.empty()) {
    lineEnd = head.find(http::CRLF);
    const auto headerStatus = parseHeaderLine(head.substr(0, lineEnd));
    if (headerStatus != http::StatusCodeOK) {
      return headerStatus;
    }
    head.remove_prefix(lineEnd + http::CRLF.size());
  }

  if (_version == Version::HTTP11 && !_headers.contains(http::Host)) {
    return http::StatusCodeBadRequest;
  }

  if (const auto contentLength = headerValue(http::ContentLength); contentLength) {
    const auto value = TryStringToIntegral<std::size_t>(*contentLength);
    if (!value) {
      return http::StatusCodeBadRequest;
    }
    _contentLength = *value;
  }
  return http::StatusCodeOK;
}

http::StatusCode HttpRequest::parseRequestLine(std::string_view line) {
  const auto firstSp = line.find(' ');
  if (firstSp == std::string_view::npos) {
    return http::StatusCodeBadRequest;
  }
  const auto secondSp = line.find(' ', firstSp + 1);
  if (secondSp == std::string_view::npos || line.find(' ', secondSp + 1) != std::string_view::npos) {
    return http::StatusCodeBadRequest;
  }

  const std::string_view methodStr = line.substr(0, firstSp);
  const std::string_view target = line.substr(firstSp + 1, secondSp - firstSp - 1);
  const std::string_view versionStr = line.substr(secondSp + 1);

  if (versionStr == http::HTTP11Sv) {
    _version = Version::HTTP11;
  } else if (versionStr == http::HTTP10Sv) {
    _version = Version::HTTP10;
  } else if (versionStr.starts_with("HTTP/")) {
    return http::StatusCodeHTTPVersionNotSupported;
  } else {
    return http::StatusCodeBadRequest;
  }

  const auto optMethod = http::MethodStrToOptEnum(methodStr);
  if (!optMethod) {
    return std::ranges::all_of(methodStr, IsTokenChar) && !methodStr.empty() ? http::StatusCodeNotImplemented
                                                                             : http::StatusCodeBadRequest;
  }
  _method = *optMethod;

  if (target.size() > kMaxRequestTargetLen) {
    return http::StatusCodeURITooLong;
  }
  if (target.empty() || (target.front() != '/' && !(target == "*" && _method == http::Method::OPTIONS))) {
    return http::StatusCodeBadRequest;
  }

  const auto queryPos = target.find('?');
  const std::string_view rawPath = target.substr(0, queryPos);
  _query = queryPos == std::string_view::npos ? std::string_view{} : target.substr(queryPos + 1);
  if (!UrlDecodePath(rawPath, _path)) {
    return http::StatusCodeBadRequest;
  }
  return http::StatusCodeOK;
}

http::StatusCode HttpRequest::parseHeaderLine(std::string_view line) {
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos || colonPos == 0) {
    return http::StatusCodeBadRequest;
  }
  const std::string_view name = line.substr(0, colonPos);
  if (!std::ranges::all_of(name, IsTokenChar)) {
    // Includes whitespace between field name and colon (RFC 9112 5.1).
    return http::StatusCodeBadRequest;
  }
  const std::string_view value = TrimOws(line.substr(colonPos + 1));

  auto [it, inserted] = _headers.try_emplace(std::string(name), value);
  if (!inserted) {
    if (CaseInsensitiveEqual(name, http::ContentLength) || CaseInsensitiveEqual(name, http::Host)) {
      return http::StatusCodeBadRequest;
    }
    it->second.append(", ").append(value);
  }
  return http::StatusCodeOK;
}

std::string_view HttpRequest::versionStr() const noexcept {
  return _version == Version::HTTP10 ? http::HTTP10Sv : http::HTTP11Sv;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const {
  const auto it = _headers.find(name);
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

bool HttpRequest::wantsKeepAlive() const {
  const auto connection = headerValue(http::Connection);
  if (_version == Version::HTTP10) {
    return connection && CaseInsensitiveEqual(TrimOws(*connection), http::keepalive);
  }
  return !connection || !CaseInsensitiveEqual(TrimOws(*connection), http::close);
}

std::optional<std::string_view> HttpRequest::pathParamValue(std::string_view name) const {
  for (const auto& [key, value] : _pathParams) {
    if (key == name) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

}  // namespace filestream
