#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "filestream/media-payload.hpp"

namespace filestream {

// Sequential reader of the bytes of an upstream media, chunk by chunk.
class ChunkReader {
 public:
  virtual ~ChunkReader() = default;

  // Returns the next chunk, or std::nullopt at the end of the requested window.
  // Throws UpstreamError on failure.
  virtual std::optional<std::string> nextChunk() = 0;
};

// Remote, chunk oriented store of media messages.
class UpstreamSource {
 public:
  virtual ~UpstreamSource() = default;

  // Live lookup of a message. Throws UpstreamError on failure.
  virtual UpstreamMessage fetchMessage(std::int64_t messageId) = 0;

  // Opens a reader on the media of 'message', starting at byte 'offset' and stopping after 'limit' bytes
  // (0 meaning up to the end of the media). Chunks are at most 'chunkSize' bytes long.
  // Throws UpstreamError on failure. Implementations may still produce more than 'limit' bytes,
  // callers are expected to clip.
  virtual std::unique_ptr<ChunkReader> streamChunks(const UpstreamMessage& message, std::uint64_t offset,
                                                    std::uint64_t limit, std::size_t chunkSize) = 0;
};

}  // namespace filestream
