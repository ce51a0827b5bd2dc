#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "filestream/media-payload.hpp"
#include "filestream/upstream-source.hpp"

namespace filestream {

// Upstream source serving the regular files of a local directory.
// Message <n> is the file named '<n>-<display name>', for instance '42-Episode 01.mkv'.
// The media kind is deduced from the MIME type of the display name: video/* gives a video, audio/* an audio,
// image/gif an animation, anything else a document.
class DirectoryUpstreamSource : public UpstreamSource {
 public:
  // Throws std::invalid_argument if 'directory' is not an existing directory.
  explicit DirectoryUpstreamSource(std::filesystem::path directory);

  // Throws UpstreamError(Protocol) if there is no file for this message.
  UpstreamMessage fetchMessage(std::int64_t messageId) override;

  // Throws UpstreamError(OffsetInvalid) if offset is past the end of the file, and UpstreamError(TransportIo)
  // if the file cannot be opened. Read errors are raised by the returned reader as UpstreamError(TransportIo).
  std::unique_ptr<ChunkReader> streamChunks(const UpstreamMessage& message, std::uint64_t offset,
                                            std::uint64_t limit, std::size_t chunkSize) override;

 private:
  [[nodiscard]] std::filesystem::path findMessageFile(std::int64_t messageId) const;

  std::filesystem::path _directory;
};

}  // namespace filestream
