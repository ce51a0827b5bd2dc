#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "filestream/chunk-generator.hpp"
#include "filestream/media-payload.hpp"
#include "filestream/upstream-source.hpp"

namespace filestream {

// Upstream message to stream: a live handle if one was already fetched, or the reference to fetch it.
struct StreamTarget {
  std::optional<std::int64_t> messageRef;
  std::optional<UpstreamMessage> message;
};

// Drives the transfer of a byte window of an upstream media into a lazy sequence of chunks.
class MediaStreamer {
 public:
  static constexpr std::size_t kDefaultChunkSize = 1UL << 20;

  // The upstream source must outlive the MediaStreamer and the generators it creates.
  explicit MediaStreamer(UpstreamSource& upstream, std::size_t chunkSize = kDefaultChunkSize) noexcept
      : _upstream(&upstream), _chunkSize(chunkSize) {}

  // Returns a generator of the bytes [from, from + byteBudget) of the target media.
  // Nothing is requested upstream before the first pull. The sequence:
  //  - never exceeds byteBudget bytes in total (chunks overshooting the window are clipped),
  //  - ends early, without raising, on any upstream failure,
  //  - never contains empty chunks.
  [[nodiscard]] ChunkGenerator stream(StreamTarget target, std::uint64_t from, std::uint64_t byteBudget) const;

  [[nodiscard]] std::size_t chunkSize() const noexcept { return _chunkSize; }

 private:
  UpstreamSource* _upstream;
  std::size_t _chunkSize;
};

}  // namespace filestream
