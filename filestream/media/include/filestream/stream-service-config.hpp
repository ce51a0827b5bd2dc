#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace filestream {

struct StreamServiceConfig {
  static constexpr std::size_t kDefaultChunkSize = 1UL << 20;
  static constexpr std::size_t kMinChunkSize = 1UL << 10;
  static constexpr std::size_t kMaxChunkSize = 64UL << 20;

  // Builds a configuration from the environment:
  //   FILESTREAM_PUBLIC_URL : public base URL
  //   FILESTREAM_CHUNK_SIZE : upstream chunk size in bytes
  // Throws std::invalid_argument if a variable has an invalid value.
  static StreamServiceConfig FromEnv();

  // Public base URL of the service, used to build links in API responses ('<publicUrl>/watch/<id>').
  // Stored without surrounding spaces nor trailing '/'. Empty gives relative links.
  std::string publicUrl;

  // Size of the chunks requested to the upstream source.
  std::size_t chunkSize{kDefaultChunkSize};

  StreamServiceConfig& withPublicUrl(std::string_view url);

  StreamServiceConfig& withChunkSize(std::size_t chunkSize) {
    this->chunkSize = chunkSize;
    return *this;
  }

  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;
};

}  // namespace filestream
