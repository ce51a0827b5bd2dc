#include "filestream/media-streamer.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "filestream/chunk-generator.hpp"
#include "filestream/log.hpp"
#include "filestream/media-payload.hpp"
#include "filestream/upstream-error.hpp"
#include "filestream/upstream-source.hpp"

namespace filestream {

namespace {

// An upstream reader serving more empty chunks in a row is considered stuck.
constexpr int kMaxConsecutiveEmptyChunks = 16;

void LogUpstreamFailure(const UpstreamError& ex, std::int64_t messageId, std::uint64_t yielded,
                        std::uint64_t byteBudget) {
  if (ex.isExpected()) {
    log::info("Stream of message {} interrupted after {}/{} bytes ({}): {}", messageId, yielded, byteBudget,
              UpstreamErrorKindToStr(ex.kind()), ex.what());
  } else {
    log::error("Stream of message {} failed after {}/{} bytes: {}", messageId, yielded, byteBudget, ex.what());
  }
}

// Fetches the message if needed and opens the upstream reader. Returns nullptr on any failure.
std::unique_ptr<ChunkReader> OpenReader(UpstreamSource& upstream, StreamTarget& target, std::uint64_t from,
                                        std::uint64_t byteBudget, std::size_t chunkSize) {
  const std::int64_t messageId = target.message ? target.message->id : target.messageRef.value_or(0);
  try {
    if (!target.message) {
      if (!target.messageRef) {
        log::warn("No upstream message reference, nothing to stream");
        return nullptr;
      }
      target.message = upstream.fetchMessage(*target.messageRef);
    }
    if (!target.message->media) {
      log::warn("Upstream message {} has no media, nothing to stream", messageId);
      return nullptr;
    }
    return upstream.streamChunks(*target.message, from, byteBudget, chunkSize);
  } catch (const UpstreamError& ex) {
    LogUpstreamFailure(ex, messageId, 0, byteBudget);
  } catch (const std::exception& ex) {
    log::error("Unexpected error opening stream of message {}: {}", messageId, ex.what());
  }
  return nullptr;
}

// Pulls the next upstream chunk. Returns std::nullopt at the end of the upstream sequence or on failure.
std::optional<std::string> NextChunk(ChunkReader& reader, std::int64_t messageId, std::uint64_t yielded,
                                     std::uint64_t byteBudget) {
  try {
    return reader.nextChunk();
  } catch (const UpstreamError& ex) {
    LogUpstreamFailure(ex, messageId, yielded, byteBudget);
  } catch (const std::exception& ex) {
    log::error("Unexpected error in stream of message {} after {}/{} bytes: {}", messageId, yielded, byteBudget,
               ex.what());
  }
  return std::nullopt;
}

ChunkGenerator StreamChunks(UpstreamSource& upstream, StreamTarget target, std::uint64_t from,
                            std::uint64_t byteBudget, std::size_t chunkSize) {
  if (byteBudget == 0) {
    co_return;
  }
  const auto reader = OpenReader(upstream, target, from, byteBudget, chunkSize);
  if (!reader) {
    co_return;
  }
  const std::int64_t messageId = target.message->id;

  std::uint64_t yielded = 0;
  int nbEmptyChunks = 0;
  while (yielded < byteBudget) {
    auto chunk = NextChunk(*reader, messageId, yielded, byteBudget);
    if (!chunk) {
      break;
    }
    if (chunk->empty()) {
      if (++nbEmptyChunks == kMaxConsecutiveEmptyChunks) {
        log::warn("Upstream of message {} served {} empty chunks in a row after {}/{} bytes, ending stream",
                  messageId, nbEmptyChunks, yielded, byteBudget);
        break;
      }
      continue;
    }
    nbEmptyChunks = 0;
    const std::uint64_t remaining = byteBudget - yielded;
    if (chunk->size() > remaining) {
      chunk->resize(static_cast<std::size_t>(remaining));
    }
    yielded += chunk->size();
    co_yield std::move(*chunk);
  }
  if (yielded < byteBudget) {
    log::info("Stream of message {} ended after {}/{} bytes", messageId, yielded, byteBudget);
  } else {
    log::debug("Stream of message {} completed ({} bytes from offset {})", messageId, yielded, from);
  }
}

}  // namespace

ChunkGenerator MediaStreamer::stream(StreamTarget target, std::uint64_t from, std::uint64_t byteBudget) const {
  return StreamChunks(*_upstream, std::move(target), from, byteBudget, _chunkSize);
}

}  // namespace filestream
