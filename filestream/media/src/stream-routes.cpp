#include "filestream/stream-routes.hpp"

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glaze/glaze.hpp>

#include "filestream/byte-range.hpp"
#include "filestream/http-constants.hpp"
#include "filestream/http-method.hpp"
#include "filestream/http-request.hpp"
#include "filestream/http-response.hpp"
#include "filestream/http-status-code.hpp"
#include "filestream/json-serializer.hpp"
#include "filestream/log.hpp"
#include "filestream/media-streamer.hpp"
#include "filestream/metadata-resolver.hpp"
#include "filestream/router.hpp"
#include "filestream/stream-headers.hpp"

namespace filestream {

namespace {

constexpr std::string_view kIdParam = "id";
constexpr std::string_view kUnknownTitle = "Unknown";
constexpr std::string_view kFileNotFoundBody = "File Not Found";

struct StatusMessage {
  std::string status;
};

struct ErrorMessage {
  std::string error;
};

struct FileInfo {
  std::string id;
  std::string title;
  std::string streamUrl;
  std::string downloadLink;
  std::optional<std::string> driveLink;
  std::optional<std::string> poster;
  std::optional<std::vector<std::string>> genres;
  std::optional<std::string> quality;
};

}  // namespace

}  // namespace filestream

template <>
struct glz::meta<filestream::StatusMessage> {
  using T = filestream::StatusMessage;
  static constexpr auto value = glz::object("status", &T::status);
};

template <>
struct glz::meta<filestream::ErrorMessage> {
  using T = filestream::ErrorMessage;
  static constexpr auto value = glz::object("error", &T::error);
};

template <>
struct glz::meta<filestream::FileInfo> {
  using T = filestream::FileInfo;
  static constexpr auto value =
      glz::object("id", &T::id, "title", &T::title, "stream_url", &T::streamUrl, "download_link", &T::downloadLink,
                  "drive_link", &T::driveLink, "poster", &T::poster, "genres", &T::genres, "quality", &T::quality);
};

namespace filestream {

namespace {

HttpResponse JsonResponse(http::StatusCode status, std::string body) {
  HttpResponse response(status);
  response.body(std::move(body), http::ContentTypeApplicationJson);
  MediaCorsPolicy().applyTo(response);
  return response;
}

HttpResponse TextResponse(http::StatusCode status, std::string body) {
  HttpResponse response(status);
  response.body(std::move(body), http::ContentTypeTextPlain);
  MediaCorsPolicy().applyTo(response);
  return response;
}

std::string_view IdOf(const HttpRequest& request) { return request.pathParamValue(kIdParam).value_or(""); }

}  // namespace

StreamService::StreamService(const LookupStore& store, UpstreamSource& upstream, StreamServiceConfig config)
    : _config(std::move(config)),
      _store(&store),
      _resolver(store, upstream),
      _streamer(upstream, _config.chunkSize) {
  _config.validate();
}

void StreamService::registerRoutes(Router& router) const {
  router.setPath(http::Method::GET, "/", [this](const HttpRequest& req) { return handleRoot(req); });
  router.setPath(http::Method::GET, "/api/file/{id}", [this](const HttpRequest& req) { return handleFileInfo(req); });
  for (const std::string_view inlinePath : {"/stream/{id}", "/watch/{id}"}) {
    router.setPath(http::Method::GET, inlinePath,
                   [this](const HttpRequest& req) { return handleStream(req, Disposition::Inline); });
    router.setPath(http::Method::OPTIONS, inlinePath, [this](const HttpRequest& req) { return handleOptions(req); });
  }
  router.setPath(http::Method::GET, "/dl/{id}",
                 [this](const HttpRequest& req) { return handleStream(req, Disposition::Attachment); });
  router.setPath(http::Method::OPTIONS, "/dl/{id}", [this](const HttpRequest& req) { return handleOptions(req); });
}

HttpResponse StreamService::handleRoot([[maybe_unused]] const HttpRequest& request) const {
  return JsonResponse(http::StatusCodeOK, SerializeToJson(StatusMessage{"running"}));
}

HttpResponse StreamService::handleFileInfo(const HttpRequest& request) const {
  const auto id = IdOf(request);
  try {
    auto record = _store->getFile(id);
    if (!record) {
      return JsonResponse(http::StatusCodeNotFound, SerializeToJson(ErrorMessage{"File not found"}));
    }

    FileInfo info;
    info.id.assign(id);
    info.title = record->animeTitle.value_or(std::string(kUnknownTitle));
    info.streamUrl = _config.publicUrl + "/watch/" + info.id;
    info.downloadLink = _config.publicUrl + "/dl/" + info.id;
    if (record->driveId && !record->driveId->empty()) {
      info.driveLink = "https://drive.google.com/file/d/" + *record->driveId + "/view";
    }
    info.poster = std::move(record->poster);
    info.genres = std::move(record->genres);
    info.quality = std::move(record->quality);
    return JsonResponse(http::StatusCodeOK, SerializeToJsonWithNulls(info));
  } catch (const std::exception& ex) {
    log::error("Error while building file info of '{}': {}", id, ex.what());
    return JsonResponse(http::StatusCodeInternalServerError, SerializeToJson(ErrorMessage{ex.what()}));
  }
}

HttpResponse StreamService::handleStream(const HttpRequest& request, Disposition disposition) const {
  const auto id = IdOf(request);
  try {
    auto resolved = _resolver.resolve(id);
    if (!resolved) {
      return TextResponse(http::StatusCodeNotFound, std::string(kFileNotFoundBody));
    }

    const auto totalSize = resolved->metadata.size;
    const auto selection = ParseRange(request.headerValue(http::Range), totalSize);
    if (!selection.satisfiable()) {
      log::debug("Range '{}' for file '{}' of {} bytes is {}", request.headerValueOrEmpty(http::Range), id, totalSize,
                 RangeSelectionStateToStr(selection.state));
      return BuildRangeNotSatisfiable(totalSize);
    }

    const ByteRange& range = selection.range;
    auto response = BuildStreamResponse(range, resolved->metadata, disposition,
                                        selection.state == RangeSelection::State::Partial);
    log::debug("Serving {} bytes [{}, {}] of file '{}' ({}) as {}", range.length(), range.from, range.until, id,
               resolved->metadata.mimeType, DispositionToStr(disposition));
    response.bodyStream(
        _streamer.stream(StreamTarget{resolved->messageRef, std::move(resolved->message)}, range.from, range.length()));
    return response;
  } catch (const std::exception& ex) {
    log::error("Error while preparing stream of '{}': {}", id, ex.what());
    std::string body("Server Error: ");
    body.append(ex.what());
    return TextResponse(http::StatusCodeInternalServerError, std::move(body));
  }
}

HttpResponse StreamService::handleOptions([[maybe_unused]] const HttpRequest& request) const {
  return MediaCorsPolicy().preflightResponse();
}

}  // namespace filestream
