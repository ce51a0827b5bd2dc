#include "filestream/router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "filestream/http-constants.hpp"
#include "filestream/http-method.hpp"
#include "filestream/http-request.hpp"
#include "filestream/http-response.hpp"
#include "filestream/http-status-code.hpp"

namespace filestream {

namespace {

HttpResponse EchoIdHandler(const HttpRequest& req) {
  return HttpResponse(http::StatusCodeOK, req.pathParamValue("id").value_or("<none>"));
}

}  // namespace

class RouterTest : public ::testing::Test {
 protected:
  HttpRequest& makeRequest(std::string_view method, std::string_view target) {
    raw.assign(method);
    raw.push_back(' ');
    raw.append(target);
    raw.append(" HTTP/1.1\r\nHost: test\r\n\r\n");
    EXPECT_EQ(request.initTrySetHead(raw, 4096), http::StatusCodeOK);
    return request;
  }

  Router router;
  HttpRequest request;
  std::string raw;
};

TEST_F(RouterTest, LiteralPath) {
  router.setPath(http::Method::GET, "/", [](const HttpRequest&) { return HttpResponse(http::StatusCodeOK, "root"); });
  const auto resp = router.dispatch(makeRequest("GET", "/"));
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "root");
}

TEST_F(RouterTest, PathParameterIsCaptured) {
  router.setPath(http::Method::GET, "/stream/{id}", EchoIdHandler);
  const auto resp = router.dispatch(makeRequest("GET", "/stream/1234"));
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "1234");
  EXPECT_EQ(request.pathParamValue("id").value_or(""), "1234");
}

TEST_F(RouterTest, TrailingSlashIsIgnored) {
  router.setPath(http::Method::GET, "/api/file/{id}", EchoIdHandler);
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/api/file/5/")).body(), "5");
}

TEST_F(RouterTest, SegmentCountMustMatch) {
  router.setPath(http::Method::GET, "/stream/{id}", EchoIdHandler);
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/stream")).status(), http::StatusCodeNotFound);
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/stream/1/2")).status(), http::StatusCodeNotFound);
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/stream//")).status(), http::StatusCodeNotFound);
}

TEST_F(RouterTest, UnknownPathIsNotFound) {
  router.setPath(http::Method::GET, "/watch/{id}", EchoIdHandler);
  const auto resp = router.dispatch(makeRequest("GET", "/nowhere"));
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
}

TEST_F(RouterTest, DefaultHandlerForUnknownPaths) {
  router.setDefault([](const HttpRequest& req) { return HttpResponse(http::StatusCodeOK, req.path()); });
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/any/thing")).body(), "/any/thing");
}

TEST_F(RouterTest, WrongMethodIsNotAllowedWithAllowHeader) {
  router.setPath(http::Method::GET | http::Method::OPTIONS, "/dl/{id}", EchoIdHandler);
  const auto resp = router.dispatch(makeRequest("POST", "/dl/1"));
  EXPECT_EQ(resp.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.headerValueOrEmpty(http::Allow), "GET, HEAD, OPTIONS");
}

TEST_F(RouterTest, HeadFallsBackOnGet) {
  router.setPath(http::Method::GET, "/watch/{id}", EchoIdHandler);
  const auto resp = router.dispatch(makeRequest("HEAD", "/watch/9"));
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "9");
}

TEST_F(RouterTest, SpecificHeadHandlerWins) {
  router.setPath(http::Method::GET, "/x", [](const HttpRequest&) { return HttpResponse(http::StatusCodeOK, "get"); });
  router.setPath(http::Method::HEAD, "/x", [](const HttpRequest&) { return HttpResponse(http::StatusCodeOK, "head"); });
  EXPECT_EQ(router.dispatch(makeRequest("HEAD", "/x")).body(), "head");
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/x")).body(), "get");
}

TEST_F(RouterTest, SamePatternWithDifferentMethodsSharesRoute) {
  router.setPath(http::Method::GET, "/stream/{id}", EchoIdHandler);
  router.setPath(http::Method::OPTIONS, "/stream/{other}",
                 [](const HttpRequest&) { return HttpResponse(http::StatusCodeOK, "options"); });
  EXPECT_EQ(router.dispatch(makeRequest("OPTIONS", "/stream/3")).body(), "options");
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/stream/3")).body(), "3");
  EXPECT_EQ(router.dispatch(makeRequest("PUT", "/stream/3")).headerValueOrEmpty(http::Allow), "GET, HEAD, OPTIONS");
}

TEST_F(RouterTest, LiteralRouteRegisteredFirstHasPriority) {
  router.setPath(http::Method::GET, "/api/file/special",
                 [](const HttpRequest&) { return HttpResponse(http::StatusCodeOK, "special"); });
  router.setPath(http::Method::GET, "/api/file/{id}", EchoIdHandler);
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/api/file/special")).body(), "special");
  EXPECT_EQ(router.dispatch(makeRequest("GET", "/api/file/other")).body(), "other");
}

TEST_F(RouterTest, MatchReportsAllowedMethods) {
  router.setPath(http::Method::GET | http::Method::OPTIONS, "/stream/{id}", EchoIdHandler);
  const auto result = router.match(http::Method::DELETE, "/stream/1");
  EXPECT_EQ(result.handler, nullptr);
  EXPECT_TRUE(http::IsMethodSet(result.allowedMethods, http::Method::GET));
  EXPECT_TRUE(http::IsMethodSet(result.allowedMethods, http::Method::OPTIONS));
  EXPECT_FALSE(http::IsMethodSet(result.allowedMethods, http::Method::DELETE));
}

TEST_F(RouterTest, InvalidPatternsThrow) {
  EXPECT_THROW(router.setPath(http::Method::GET, "relative", EchoIdHandler), std::invalid_argument);
  EXPECT_THROW(router.setPath(http::Method::GET, "/a//b", EchoIdHandler), std::invalid_argument);
  EXPECT_THROW(router.setPath(http::Method::GET, "/{}", EchoIdHandler), std::invalid_argument);
  EXPECT_THROW(router.setPath(http::Method::GET, "/{id", EchoIdHandler), std::invalid_argument);
  EXPECT_THROW(router.setPath(http::MethodBmp{}, "/a", EchoIdHandler), std::invalid_argument);
}

}  // namespace filestream
