#pragma once

#include "filestream/http-request.hpp"
#include "filestream/http-response.hpp"
#include "filestream/lookup-store.hpp"
#include "filestream/media-streamer.hpp"
#include "filestream/metadata-resolver.hpp"
#include "filestream/router.hpp"
#include "filestream/stream-headers.hpp"
#include "filestream/stream-service-config.hpp"
#include "filestream/upstream-source.hpp"

namespace filestream {

// HTTP surface of the media service:
//   GET|HEAD           /               -> {"status":"running"}
//   GET|HEAD           /api/file/{id}  -> metadata and links of a file, as JSON
//   GET|HEAD|OPTIONS   /stream/{id}    -> range-streamed media, inline
//   GET|HEAD|OPTIONS   /watch/{id}     -> range-streamed media, inline
//   GET|HEAD|OPTIONS   /dl/{id}        -> range-streamed media, attachment
// The lookup store and the upstream source must outlive the service and the responses it creates.
class StreamService {
 public:
  // Throws std::invalid_argument if the configuration is invalid.
  StreamService(const LookupStore& store, UpstreamSource& upstream, StreamServiceConfig config = {});

  // Registers all routes of the service into given router.
  void registerRoutes(Router& router) const;

  [[nodiscard]] HttpResponse handleRoot(const HttpRequest& request) const;

  [[nodiscard]] HttpResponse handleFileInfo(const HttpRequest& request) const;

  // Streams the byte range requested by the 'Range' header of the object whose id is the 'id' path parameter.
  [[nodiscard]] HttpResponse handleStream(const HttpRequest& request, Disposition disposition) const;

  // CORS preflight answer, whatever the id.
  [[nodiscard]] HttpResponse handleOptions(const HttpRequest& request) const;

  [[nodiscard]] const StreamServiceConfig& config() const noexcept { return _config; }

 private:
  StreamServiceConfig _config;
  const LookupStore* _store;
  MetadataResolver _resolver;
  MediaStreamer _streamer;
};

}  // namespace filestream
