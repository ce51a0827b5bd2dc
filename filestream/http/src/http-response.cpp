#include "filestream/http-response.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "filestream/chunk-generator.hpp"
#include "filestream/http-constants.hpp"
#include "filestream/http-header.hpp"
#include "filestream/string-equal-ignore-case.hpp"
#include "filestream/stringconv.hpp"

namespace filestream {

namespace {

void AppendHeaderLine(std::string& out, std::string_view name, std::string_view value) {
  out.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
}

}  // namespace

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) & {
  eraseHeader(name);
  return addHeader(name, value);
}

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) & {
  _headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_headers, [name](const http::Header& hdr) {
    return CaseInsensitiveEqual(hdr.name, name);
  });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) & {
  _body = std::move(body);
  _bodyStream.reset();
  _declaredLength.reset();
  eraseHeader(http::ContentLength);
  if (!contentType.empty()) {
    header(http::ContentType, contentType);
  }
  return *this;
}

HttpResponse& HttpResponse::contentLength(std::uint64_t length) & {
  _declaredLength = length;
  return header(http::ContentLength, IntegralToString(length));
}

HttpResponse& HttpResponse::bodyStream(ChunkGenerator generator) & {
  _body.clear();
  _bodyStream = std::move(generator);
  return *this;
}

std::string HttpResponse::serializeHead(std::string_view version, bool keepAlive,
                                        std::span<const http::Header> globalHeaders, std::string_view date) const {
  std::string out;
  out.reserve(256U + (_headers.size() * 48U));

  const auto reason = http::ReasonPhraseFor(_statusCode);
  out.append(version).push_back(' ');
  out.append(IntegralToString(_statusCode));
  out.push_back(' ');
  out.append(reason).append(http::CRLF);

  for (const auto& hdr : _headers) {
    if (hasBodyStream() || !CaseInsensitiveEqual(hdr.name, http::ContentLength)) {
      AppendHeaderLine(out, hdr.name, hdr.value);
    }
  }
  for (const auto& hdr : globalHeaders) {
    if (!headerValue(hdr.name)) {
      AppendHeaderLine(out, hdr.name, hdr.value);
    }
  }
  if (!date.empty() && !headerValue(http::Date)) {
    AppendHeaderLine(out, http::Date, date);
  }
  if (!hasBodyStream()) {
    AppendHeaderLine(out, http::ContentLength, IntegralToString(_body.size()));
  }
  if (!keepAlive) {
    AppendHeaderLine(out, http::Connection, http::close);
  } else if (version == http::HTTP10Sv) {
    AppendHeaderLine(out, http::Connection, http::keepalive);
  }
  out.append(http::CRLF);
  return out;
}

void HttpResponse::eraseHeader(std::string_view name) noexcept {
  std::erase_if(_headers, [name](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name, name); });
}

}  // namespace filestream
