#include "filestream/stream-service-config.hpp"

#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

#include "filestream/string-trim.hpp"
#include "filestream/stringconv.hpp"

namespace filestream {

StreamServiceConfig StreamServiceConfig::FromEnv() {
  StreamServiceConfig config;
  if (const char* publicUrl = std::getenv("FILESTREAM_PUBLIC_URL"); publicUrl != nullptr) {
    config.withPublicUrl(publicUrl);
  }
  if (const char* chunkSize = std::getenv("FILESTREAM_CHUNK_SIZE"); chunkSize != nullptr) {
    config.withChunkSize(StringToIntegral<std::size_t>(TrimSpaces(chunkSize)));
  }
  config.validate();
  return config;
}

StreamServiceConfig& StreamServiceConfig::withPublicUrl(std::string_view url) {
  url = TrimSpaces(url);
  while (url.ends_with('/')) {
    url.remove_suffix(1);
  }
  publicUrl.assign(url);
  return *this;
}

void StreamServiceConfig::validate() const {
  if (chunkSize < kMinChunkSize || chunkSize > kMaxChunkSize) {
    throw std::invalid_argument(
        fmt::format("chunkSize {} should be between {} and {}", chunkSize, kMinChunkSize, kMaxChunkSize));
  }
  if (publicUrl.find_first_of(" \r\n") != std::string::npos) {
    throw std::invalid_argument("publicUrl should not contain spaces or line breaks");
  }
}

}  // namespace filestream
