#pragma once

#include <cstddef>
#include <string_view>

#include "filestream/http-status-code.hpp"

namespace filestream::http {

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view DELETE = "DELETE";
inline constexpr std::string_view OPTIONS = "OPTIONS";
inline constexpr std::string_view PATCH = "PATCH";

// Header names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view UserAgent = "User-Agent";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Server = "Server";
inline constexpr std::string_view Origin = "Origin";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view Range = "Range";
inline constexpr std::string_view XRequestedWith = "X-Requested-With";
inline constexpr std::string_view AccessControlAllowOrigin = "Access-Control-Allow-Origin";
inline constexpr std::string_view AccessControlAllowMethods = "Access-Control-Allow-Methods";
inline constexpr std::string_view AccessControlAllowHeaders = "Access-Control-Allow-Headers";
inline constexpr std::string_view AccessControlExposeHeaders = "Access-Control-Expose-Headers";
inline constexpr std::string_view AccessControlMaxAge = "Access-Control-Max-Age";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Header values
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view bytes = "bytes";

// Reason phrases
inline constexpr std::string_view ReasonOK = "OK";                                               // 200
inline constexpr std::string_view ReasonNoContent = "No Content";                                // 204
inline constexpr std::string_view ReasonPartialContent = "Partial Content";                      // 206
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                              // 400
inline constexpr std::string_view ReasonForbidden = "Forbidden";                                 // 403
inline constexpr std::string_view ReasonNotFound = "Not Found";                                  // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";                 // 405
inline constexpr std::string_view ReasonRequestTimeout = "Request Timeout";                      // 408
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";                   // 413
inline constexpr std::string_view ReasonURITooLong = "URI Too Long";                             // 414
inline constexpr std::string_view ReasonRangeNotSatisfiable = "Range Not Satisfiable";           // 416
inline constexpr std::string_view ReasonHeadersTooLarge = "Request Header Fields Too Large";     // 431
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";           // 500
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";                      // 501
inline constexpr std::string_view ReasonBadGateway = "Bad Gateway";                              // 502
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";              // 503
inline constexpr std::string_view ReasonHTTPVersionNotSupported = "HTTP Version Not Supported";  // 505

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodePartialContent:
      return ReasonPartialContent;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeRequestTimeout:
      return ReasonRequestTimeout;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeURITooLong:
      return ReasonURITooLong;
    case StatusCodeRangeNotSatisfiable:
      return ReasonRangeNotSatisfiable;
    case StatusCodeRequestHeaderFieldsTooLarge:
      return ReasonHeadersTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    case StatusCodeBadGateway:
      return ReasonBadGateway;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    case StatusCodeHTTPVersionNotSupported:
      return ReasonHTTPVersionNotSupported;
    default:
      return {};
  }
}

}  // namespace filestream::http
