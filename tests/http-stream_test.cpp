#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "filestream/fake-upstream-source.hpp"
#include "filestream/file-record.hpp"
#include "filestream/http-request.hpp"
#include "filestream/http-response.hpp"
#include "filestream/http-server-config.hpp"
#include "filestream/in-memory-lookup-store.hpp"
#include "filestream/media-payload.hpp"
#include "filestream/router.hpp"
#include "filestream/stream-routes.hpp"
#include "filestream/stream-service-config.hpp"
#include "filestream/upstream-error.hpp"
#include "filestream/test_server_fixture.hpp"
#include "filestream/test_util.hpp"

using namespace std::chrono_literals;

namespace filestream {

namespace {

constexpr std::size_t kChunkSize = 1024;

std::string MakeContent(std::size_t size) {
  std::string content(size, '\0');
  for (std::size_t pos = 0; pos < size; ++pos) {
    content[pos] = static_cast<char>('a' + ((pos * 7U) % 26U));
  }
  return content;
}

FileRecord Record(std::string id, std::int64_t fileId) {
  FileRecord record;
  record.id = std::move(id);
  record.fileId = fileId;
  return record;
}

}  // namespace

class HttpStreamTest : public ::testing::Test {
 protected:
  // Called before the server loop starts.
  void setUpRoutes(Router& router) {
    store.add(Record("movie", 42));
    store.add(Record("small", 43));
    upstream.addMedia(42, content, MediaKind::Video, "Movie.mp4", "video/mp4");
    upstream.addMedia(43, MakeContent(1000), MediaKind::Video, "Small.mkv", "video/x-matroska");
    service.registerRoutes(router);
  }

  test::ParsedResponse request(const test::RequestOptions& opt) {
    return test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  }

  test::ParsedResponse get(std::string target, std::vector<std::pair<std::string, std::string>> headers = {}) {
    test::RequestOptions opt;
    opt.target = std::move(target);
    opt.headers = std::move(headers);
    return request(opt);
  }

  std::string content = MakeContent(64UL * 1024UL);
  test::InMemoryLookupStore store;
  test::FakeUpstreamSource upstream;
  StreamService service{store, upstream, StreamServiceConfig{}.withChunkSize(kChunkSize)};
  test::TestServer ts{HttpServerConfig{}, [this](Router& router) { setUpRoutes(router); }};
};

TEST_F(HttpStreamTest, FullContent) {
  const auto resp = get("/stream/movie");
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Length"), "65536");
  EXPECT_EQ(resp.header("Content-Range"), "bytes 0-65535/65536");
  EXPECT_EQ(resp.header("Content-Type"), "video/mp4");
  EXPECT_EQ(resp.header("Accept-Ranges"), "bytes");
  EXPECT_EQ(resp.header("Server"), "filestream");
  EXPECT_TRUE(resp.hasHeader("Date"));
  EXPECT_EQ(resp.header("Connection"), "close");
  EXPECT_EQ(resp.body, content);
}

TEST_F(HttpStreamTest, PartialContent) {
  const auto resp = get("/watch/small", {{"Range", "bytes=500-599"}});
  EXPECT_EQ(resp.statusCode, 206);
  EXPECT_EQ(resp.reason, "Partial Content");
  EXPECT_EQ(resp.header("Content-Length"), "100");
  EXPECT_EQ(resp.header("Content-Range"), "bytes 500-599/1000");
  EXPECT_EQ(resp.header("Content-Disposition"), R"(inline; filename="Small.mkv")");
  EXPECT_EQ(resp.body, MakeContent(1000).substr(500, 100));
}

TEST_F(HttpStreamTest, SingleByteAndSuffixRanges) {
  auto resp = get("/stream/small", {{"Range", "bytes=0-0"}});
  EXPECT_EQ(resp.statusCode, 206);
  EXPECT_EQ(resp.body.size(), 1U);

  resp = get("/stream/small", {{"Range", "bytes=999-"}});
  EXPECT_EQ(resp.statusCode, 206);
  EXPECT_EQ(resp.header("Content-Range"), "bytes 999-999/1000");
  EXPECT_EQ(resp.body.size(), 1U);
}

TEST_F(HttpStreamTest, RangeNotSatisfiable) {
  const auto resp = get("/stream/small", {{"Range", "bytes=999-1500"}});
  EXPECT_EQ(resp.statusCode, 416);
  EXPECT_EQ(resp.header("Content-Range"), "bytes */1000");
  EXPECT_EQ(resp.body, "416: Range not satisfiable");
  EXPECT_EQ(upstream.nbStreamCalls(), 0);
}

TEST_F(HttpStreamTest, DownloadAttachment) {
  const auto resp = get("/dl/small", {{"Range", "bytes=10-19"}});
  EXPECT_EQ(resp.statusCode, 206);
  EXPECT_EQ(resp.header("Content-Disposition"), R"(attachment; filename="Small.mkv")");
  EXPECT_EQ(resp.body.size(), 10U);
}

TEST_F(HttpStreamTest, UnknownIdIsNotFound) {
  const auto resp = get("/stream/nope");
  EXPECT_EQ(resp.statusCode, 404);
  EXPECT_EQ(resp.body, "File Not Found");
  EXPECT_EQ(resp.header("Access-Control-Allow-Origin"), "*");
}

TEST_F(HttpStreamTest, OptionsPreflight) {
  test::RequestOptions opt;
  opt.method = "OPTIONS";
  opt.target = "/dl/anything";
  const auto resp = request(opt);
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Length"), "0");
  EXPECT_TRUE(resp.body.empty());
  EXPECT_EQ(resp.header("Access-Control-Allow-Methods"), "GET, POST, OPTIONS, HEAD");
  EXPECT_EQ(resp.header("Access-Control-Allow-Headers"), "Content-Type, Range, User-Agent, X-Requested-With");
  EXPECT_EQ(resp.header("Access-Control-Expose-Headers"), "Content-Length, Content-Range, Content-Disposition");
  EXPECT_EQ(resp.header("Access-Control-Max-Age"), "86400");
}

TEST_F(HttpStreamTest, HeadDoesNotPullTheStream) {
  test::RequestOptions opt;
  opt.method = "HEAD";
  opt.target = "/stream/small";
  opt.headers = {{"Range", "bytes=100-199"}};
  const auto resp = request(opt);
  EXPECT_EQ(resp.statusCode, 206);
  EXPECT_EQ(resp.header("Content-Length"), "100");
  EXPECT_EQ(resp.header("Content-Range"), "bytes 100-199/1000");
  EXPECT_TRUE(resp.body.empty());
  EXPECT_EQ(upstream.nbStreamCalls(), 0);
}

TEST_F(HttpStreamTest, TruncatedUpstreamClosesConnection) {
  upstream.endAfter(3);
  test::ClientConnection cnx(ts.port());
  test::RequestOptions opt;
  opt.target = "/stream/movie";
  opt.connection.clear();  // HTTP/1.1 default: keep-alive
  ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(opt)));
  const auto raw = test::recvUntilClosed(cnx.fd());
  const auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Length"), "65536");
  EXPECT_EQ(resp.body, content.substr(0, 3 * kChunkSize));
}

TEST_F(HttpStreamTest, MidStreamUpstreamErrorTruncates) {
  upstream.failReadAfter(5, UpstreamErrorKind::TransportIo);
  const auto resp = get("/stream/movie", {{"Range", "bytes=1000-"}});
  EXPECT_EQ(resp.statusCode, 206);
  EXPECT_EQ(resp.header("Content-Length"), "64536");
  EXPECT_EQ(resp.body, content.substr(1000, 5 * kChunkSize));
}

TEST_F(HttpStreamTest, KeepAliveRepeatedRangesAreIdentical) {
  test::ClientConnection cnx(ts.port());
  test::RequestOptions opt;
  opt.target = "/stream/movie";
  opt.connection = "keep-alive";
  opt.headers = {{"Range", "bytes=4000-13999"}};
  const auto req = test::buildRequest(opt);

  std::vector<std::string> bodies;
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(test::sendAll(cnx.fd(), req));
    const auto resp = test::parseResponseOrThrow(test::recvResponse(cnx.fd()));
    EXPECT_EQ(resp.statusCode, 206);
    EXPECT_EQ(resp.header("Connection"), "");
    bodies.push_back(resp.body);
  }
  EXPECT_EQ(bodies[0], content.substr(4000, 10000));
  EXPECT_EQ(bodies[1], bodies[0]);
  EXPECT_EQ(bodies[2], bodies[0]);
  EXPECT_EQ(upstream.nbStreamCalls(), 3);
}

TEST_F(HttpStreamTest, PipelinedRequestWaitsForStreamedBody) {
  test::ClientConnection cnx(ts.port());
  test::RequestOptions first;
  first.target = "/stream/movie";
  first.connection = "keep-alive";
  test::RequestOptions second;
  second.target = "/";
  ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(first) + test::buildRequest(second)));

  const auto raw = test::recvUntilClosed(cnx.fd());
  const auto firstEnd = raw.find("\r\n\r\n") + 4U + content.size();
  ASSERT_LE(firstEnd, raw.size());
  const auto resp1 = test::parseResponseOrThrow(std::string_view(raw).substr(0, firstEnd));
  EXPECT_EQ(resp1.statusCode, 200);
  EXPECT_EQ(resp1.body, content);
  const auto resp2 = test::parseResponseOrThrow(std::string_view(raw).substr(firstEnd));
  EXPECT_EQ(resp2.statusCode, 200);
  EXPECT_EQ(resp2.body, R"({"status":"running"})");
}

TEST_F(HttpStreamTest, ClientGoingAwayCancelsStream) {
  {
    test::ClientConnection cnx(ts.port());
    test::RequestOptions opt;
    opt.target = "/stream/movie";
    ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(opt)));
    // read the head only, then close
    std::string partial = test::recvResponse(cnx.fd(), true);
    EXPECT_TRUE(partial.starts_with("HTTP/1.1 200"));
  }
  // the server keeps serving other clients
  const auto resp = get("/");
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_LE(upstream.nbChunksServed(), 64);
}

TEST_F(HttpStreamTest, RootAndFileInfo) {
  auto resp = get("/");
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Type"), "application/json");
  EXPECT_EQ(resp.body, R"({"status":"running"})");

  resp = get("/api/file/movie");
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_NE(resp.body.find(R"("stream_url":"/watch/movie")"), std::string::npos);
  EXPECT_NE(resp.body.find(R"("download_link":"/dl/movie")"), std::string::npos);

  resp = get("/api/file/nope");
  EXPECT_EQ(resp.statusCode, 404);
  EXPECT_EQ(resp.body, R"({"error":"File not found"})");
}

TEST_F(HttpStreamTest, MethodNotAllowed) {
  test::RequestOptions opt;
  opt.method = "DELETE";
  opt.target = "/stream/movie";
  const auto resp = request(opt);
  EXPECT_EQ(resp.statusCode, 405);
  EXPECT_EQ(resp.header("Allow"), "GET, HEAD, OPTIONS");
}

TEST_F(HttpStreamTest, UnknownPath) {
  EXPECT_EQ(get("/nowhere").statusCode, 404);
  EXPECT_EQ(get("/stream").statusCode, 404);
}

TEST(HttpServerLimits, RequestErrors) {
  test::TestServer ts(HttpServerConfig{}.withMaxHeaderBytes(512).withMaxBodyBytes(16), [](Router& router) {
    router.setDefault([](const HttpRequest&) { return HttpResponse(200, "default"); });
  });

  test::RequestOptions opt;
  opt.method = "POST";
  opt.body = std::string(100, 'x');
  EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt)).statusCode, 413);

  opt.body = "small";
  const auto ok = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  EXPECT_EQ(ok.statusCode, 200);
  EXPECT_EQ(ok.body, "default");

  opt.body.clear();
  opt.headers = {{"Transfer-Encoding", "chunked"}};
  EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt)).statusCode, 501);

  opt.method = "GET";
  opt.headers = {{"X-Big", std::string(1024, 'y')}};
  EXPECT_EQ(test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt)).statusCode, 431);

  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /\r\n\r\n"));
  EXPECT_EQ(test::parseResponseOrThrow(test::recvUntilClosed(cnx.fd())).statusCode, 400);

  test::ClientConnection cnx2(ts.port());
  ASSERT_TRUE(test::sendAll(cnx2.fd(), "GET / HTTP/2.0\r\nHost: x\r\n\r\n"));
  EXPECT_EQ(test::parseResponseOrThrow(test::recvUntilClosed(cnx2.fd())).statusCode, 505);
}

TEST(HttpServerLimits, PipelinedInputIsBoundedWhileStreaming) {
  constexpr std::size_t kMediaSize = 32UL << 20;
  constexpr std::size_t kUploadSize = 48UL << 20;

  const std::string media = MakeContent(kMediaSize);
  test::InMemoryLookupStore store;
  test::FakeUpstreamSource upstream;
  StreamService service(store, upstream, StreamServiceConfig{}.withChunkSize(64UL * 1024UL));
  test::TestServer ts(HttpServerConfig{}.withMaxBodyBytes(kUploadSize), [&](Router& router) {
    store.add(Record("big", 7));
    upstream.addMedia(7, media);
    service.registerRoutes(router);
  });

  test::ClientConnection cnx(ts.port());
  test::RequestOptions streamReq;
  streamReq.target = "/stream/big";
  streamReq.connection = "keep-alive";
  test::RequestOptions uploadReq;
  uploadReq.method = "POST";
  uploadReq.connection = "keep-alive";
  uploadReq.headers = {{"Content-Length", std::to_string(kUploadSize)}};
  test::RequestOptions lastReq;

  // The streamed response is not read yet: the server must stop accepting the upload.
  std::string pipelined = test::buildRequest(streamReq) + test::buildRequest(uploadReq);
  const std::size_t headsSize = pipelined.size();
  pipelined.append(kUploadSize, 'u');
  const auto nbAccepted = test::sendUntilStalled(cnx.fd(), pipelined, 300ms);
  EXPECT_LT(nbAccepted, headsSize + kUploadSize / 2);

  const auto streamed = test::parseResponseOrThrow(test::recvResponse(cnx.fd()));
  EXPECT_EQ(streamed.statusCode, 200);
  EXPECT_EQ(streamed.body.size(), kMediaSize);
  EXPECT_TRUE(streamed.body == media);

  // Reading resumes once the body is complete.
  ASSERT_TRUE(test::sendAll(cnx.fd(), std::string_view(pipelined).substr(nbAccepted), 10s));
  ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(lastReq)));
  const auto tail = test::recvUntilClosed(cnx.fd());
  const auto lastPos = tail.rfind("HTTP/1.1 ");
  ASSERT_NE(lastPos, std::string::npos);
  const auto last = test::parseResponseOrThrow(std::string_view(tail).substr(lastPos));
  EXPECT_EQ(last.statusCode, 200);
  EXPECT_EQ(last.body, R"({"status":"running"})");
}

}  // namespace filestream
