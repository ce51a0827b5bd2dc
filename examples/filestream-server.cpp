// filestream-server - range-aware media streaming server
//
// Serves the files described by a JSON catalog, whose bytes are read from a media directory
// (see DirectoryUpstreamSource for the naming of the media files).

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "filestream/catalog-lookup-store.hpp"
#include "filestream/directory-upstream-source.hpp"
#include "filestream/http-server-config.hpp"
#include "filestream/http-server.hpp"
#include "filestream/log.hpp"
#include "filestream/router.hpp"
#include "filestream/signal-handler.hpp"
#include "filestream/stream-routes.hpp"
#include "filestream/stream-service-config.hpp"
#include "filestream/stringconv.hpp"

using namespace filestream;

namespace {

struct ServerArgs {
  uint16_t port{8080};
  std::string catalogPath{"catalog.json"};
  std::string mediaDir{"media"};
  std::string publicUrl;
  std::string logLevel{"info"};
};

std::string EnvOr(const char* name, std::string defaultValue) {
  const char* value = std::getenv(name);
  return value == nullptr ? std::move(defaultValue) : std::string(value);
}

void PrintUsage(std::string_view programName) {
  std::cout << "Usage: " << programName << " [options]\n"
            << "Options:\n"
            << "  --port N          Listen port (default: 8080, env: FILESTREAM_PORT)\n"
            << "  --catalog FILE    JSON catalog of files (default: catalog.json, env: FILESTREAM_CATALOG)\n"
            << "  --media-dir DIR   Directory of media files (default: media, env: FILESTREAM_MEDIA_DIR)\n"
            << "  --public-url URL  Public base URL for API links (env: FILESTREAM_PUBLIC_URL)\n"
            << "  --log-level LVL   trace|debug|info|warn|error|critical|off (env: FILESTREAM_LOG_LEVEL)\n"
            << "  --help            Show this help\n"
            << "Env FILESTREAM_CHUNK_SIZE sets the upstream chunk size in bytes (default: 1 MiB).\n";
}

// Returns false if the program should exit (help requested).
// Throws std::invalid_argument on invalid arguments.
bool ParseArgs(int argc, char* argv[], ServerArgs& args) {
  args.port = StringToIntegral<uint16_t>(EnvOr("FILESTREAM_PORT", "8080"));
  args.catalogPath = EnvOr("FILESTREAM_CATALOG", std::move(args.catalogPath));
  args.mediaDir = EnvOr("FILESTREAM_MEDIA_DIR", std::move(args.mediaDir));
  args.logLevel = EnvOr("FILESTREAM_LOG_LEVEL", std::move(args.logLevel));

  for (int argPos = 1; argPos < argc; ++argPos) {
    std::string_view arg(argv[argPos]);
    const bool hasValue = argPos + 1 < argc;
    if (arg == "--port" && hasValue) {
      args.port = StringToIntegral<uint16_t>(argv[++argPos]);
    } else if (arg == "--catalog" && hasValue) {
      args.catalogPath = argv[++argPos];
    } else if (arg == "--media-dir" && hasValue) {
      args.mediaDir = argv[++argPos];
    } else if (arg == "--public-url" && hasValue) {
      args.publicUrl = argv[++argPos];
    } else if (arg == "--log-level" && hasValue) {
      args.logLevel = argv[++argPos];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return false;
    } else {
      throw std::invalid_argument("Unknown or incomplete argument " + std::string(arg));
    }
  }
  return true;
}

void SetLogLevel(std::string_view levelStr) {
  const auto level = log::level::from_str(std::string(levelStr));
  // from_str returns 'off' for unknown names
  if (level == log::level::off && levelStr != "off") {
    throw std::invalid_argument("Invalid log level " + std::string(levelStr));
  }
  log::set_level(level);
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    ServerArgs args;
    if (!ParseArgs(argc, argv, args)) {
      return EXIT_SUCCESS;
    }
    SetLogLevel(args.logLevel);

    // Enable signal handler for graceful shutdown on Ctrl+C
    SignalHandler::Enable();

    auto serviceConfig = StreamServiceConfig::FromEnv();
    if (!args.publicUrl.empty()) {
      serviceConfig.withPublicUrl(args.publicUrl);
    }

    const auto store = CatalogLookupStore::FromFile(args.catalogPath);
    DirectoryUpstreamSource upstream(args.mediaDir);
    const StreamService service(store, upstream, std::move(serviceConfig));

    Router router;
    service.registerRoutes(router);

    HttpServer server(HttpServerConfig{}.withPort(args.port), std::move(router));
    log::info("Serving {} file(s) from '{}' on port {}", store.size(), args.mediaDir, server.port());
    server.run();  // blocking run, until Ctrl+C
  } catch (const std::exception& ex) {
    std::cerr << "filestream-server error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
