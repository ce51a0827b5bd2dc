#include "filestream/http-request.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "filestream/http-method.hpp"
#include "filestream/http-status-code.hpp"

namespace filestream {

class HttpRequestTest : public ::testing::Test {
 protected:
  http::StatusCode parse(std::string_view raw, std::size_t maxHeaderBytes = 8192) {
    return request.initTrySetHead(raw, maxHeaderBytes);
  }

  HttpRequest request;
};

TEST_F(HttpRequestTest, ParsesSimpleGet) {
  static constexpr std::string_view kRaw = "GET /stream/42?x=1 HTTP/1.1\r\nHost: localhost\r\nRange: bytes=0-9\r\n\r\n";
  ASSERT_EQ(parse(kRaw), http::StatusCodeOK);
  EXPECT_EQ(request.method(), http::Method::GET);
  EXPECT_EQ(request.version(), HttpRequest::Version::HTTP11);
  EXPECT_EQ(request.versionStr(), "HTTP/1.1");
  EXPECT_EQ(request.path(), "/stream/42");
  EXPECT_EQ(request.query(), "x=1");
  EXPECT_EQ(request.headSize(), kRaw.size());
  EXPECT_EQ(request.headerValueOrEmpty("range"), "bytes=0-9");
  EXPECT_EQ(request.headerValueOrEmpty("RANGE"), "bytes=0-9");
  EXPECT_FALSE(request.headerValue("Content-Type").has_value());
  EXPECT_TRUE(request.wantsKeepAlive());
}

TEST_F(HttpRequestTest, IncompleteHeadNeedsMoreData) {
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nHost: a\r\n"), HttpRequest::kStatusNeedMoreData);
}

TEST_F(HttpRequestTest, HeadTooLarge) {
  std::string raw("GET / HTTP/1.1\r\nHost: a\r\nX-Big: ");
  raw.append(200, 'x');
  EXPECT_EQ(parse(raw, 64), http::StatusCodeRequestHeaderFieldsTooLarge);
  raw.append("\r\n\r\n");
  EXPECT_EQ(parse(raw, 64), http::StatusCodeRequestHeaderFieldsTooLarge);
}

TEST_F(HttpRequestTest, ParsesOnlyTheHeadAndReportsItsSize) {
  static constexpr std::string_view kHead = "POST /upload HTTP/1.1\r\nHost: a\r\nContent-Length: 5\r\n\r\n";
  std::string raw(kHead);
  raw.append("hello");
  ASSERT_EQ(parse(raw), http::StatusCodeOK);
  EXPECT_EQ(request.method(), http::Method::POST);
  EXPECT_EQ(request.headSize(), kHead.size());
  EXPECT_EQ(request.contentLength(), 5U);
}

TEST_F(HttpRequestTest, MissingHostInHttp11IsBadRequest) {
  EXPECT_EQ(parse("GET / HTTP/1.1\r\n\r\n"), http::StatusCodeBadRequest);
}

TEST_F(HttpRequestTest, Http10DoesNotRequireHost) {
  ASSERT_EQ(parse("GET / HTTP/1.0\r\n\r\n"), http::StatusCodeOK);
  EXPECT_EQ(request.version(), HttpRequest::Version::HTTP10);
  EXPECT_FALSE(request.wantsKeepAlive());
}

TEST_F(HttpRequestTest, Http10KeepAlive) {
  ASSERT_EQ(parse("GET / HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n"), http::StatusCodeOK);
  EXPECT_TRUE(request.wantsKeepAlive());
}

TEST_F(HttpRequestTest, Http11ConnectionClose) {
  ASSERT_EQ(parse("GET / HTTP/1.1\r\nHost: a\r\nConnection: close\r\n\r\n"), http::StatusCodeOK);
  EXPECT_FALSE(request.wantsKeepAlive());
}

TEST_F(HttpRequestTest, UnsupportedVersion) {
  EXPECT_EQ(parse("GET / HTTP/2.0\r\nHost: a\r\n\r\n"), http::StatusCodeHTTPVersionNotSupported);
  EXPECT_EQ(parse("GET / FTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeBadRequest);
}

TEST_F(HttpRequestTest, UnknownMethodIsNotImplemented) {
  EXPECT_EQ(parse("BREW /pot HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeNotImplemented);
  EXPECT_EQ(parse("get / HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeNotImplemented);
}

TEST_F(HttpRequestTest, MalformedRequestLines) {
  EXPECT_EQ(parse("GET\r\nHost: a\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(parse("GET /  HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(parse("GET relative HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeBadRequest);
}

TEST_F(HttpRequestTest, AsteriskTargetOnlyForOptions) {
  EXPECT_EQ(parse("OPTIONS * HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeOK);
  EXPECT_EQ(parse("GET * HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeBadRequest);
}

TEST_F(HttpRequestTest, TargetTooLong) {
  std::string raw("GET /");
  raw.append(5000, 'a');
  raw.append(" HTTP/1.1\r\nHost: a\r\n\r\n");
  EXPECT_EQ(parse(raw, 16384), http::StatusCodeURITooLong);
}

TEST_F(HttpRequestTest, PathIsPercentDecoded) {
  ASSERT_EQ(parse("GET /dl/my%20file%2Fx HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeOK);
  EXPECT_EQ(request.path(), "/dl/my file/x");
  EXPECT_EQ(parse("GET /bad%2 HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(parse("GET /bad%zz HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeBadRequest);
}

TEST_F(HttpRequestTest, RepeatedHeadersAreMerged) {
  ASSERT_EQ(parse("GET / HTTP/1.1\r\nHost: a\r\nAccept: text/html\r\naccept: */*\r\n\r\n"), http::StatusCodeOK);
  EXPECT_EQ(request.headerValueOrEmpty("Accept"), "text/html, */*");
}

TEST_F(HttpRequestTest, RepeatedContentLengthOrHostIsRejected) {
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nHost: a\r\nHost: b\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(parse("POST / HTTP/1.1\r\nHost: a\r\nContent-Length: 1\r\nContent-Length: 1\r\n\r\n"),
            http::StatusCodeBadRequest);
}

TEST_F(HttpRequestTest, InvalidHeaderLines) {
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nHost: a\r\nNoColon\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nHost: a\r\nBad Name: v\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nHost : a\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(parse("POST / HTTP/1.1\r\nHost: a\r\nContent-Length: -1\r\n\r\n"), http::StatusCodeBadRequest);
}

TEST_F(HttpRequestTest, HeaderValuesAreTrimmed) {
  ASSERT_EQ(parse("GET / HTTP/1.1\r\nHost: a\r\nRange: \t bytes=1-2 \t\r\n\r\n"), http::StatusCodeOK);
  EXPECT_EQ(request.headerValueOrEmpty("Range"), "bytes=1-2");
}

TEST_F(HttpRequestTest, PathParams) {
  ASSERT_EQ(parse("GET /stream/7 HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeOK);
  EXPECT_FALSE(request.pathParamValue("id"));
  request.setPathParams({{"id", "7"}});
  EXPECT_EQ(request.pathParamValue("id").value_or(""), "7");
  EXPECT_FALSE(request.pathParamValue("other"));

  // A new parse resets captured parameters
  ASSERT_EQ(parse("GET /stream/8 HTTP/1.1\r\nHost: a\r\n\r\n"), http::StatusCodeOK);
  EXPECT_TRUE(request.pathParams().empty());
}

}  // namespace filestream
