#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "filestream/media-payload.hpp"
#include "filestream/upstream-error.hpp"
#include "filestream/upstream-source.hpp"

namespace filestream::test {

// Scriptable in-memory UpstreamSource.
// Configure it before handing it to the code under test, counters can be read from any thread.
class FakeUpstreamSource : public UpstreamSource {
 public:
  // Registers a message whose media bytes are 'content'. The payload file size is the content size.
  void addMedia(std::int64_t messageId, std::string content, MediaKind kind = MediaKind::Video,
                std::optional<std::string> fileName = std::nullopt,
                std::optional<std::string> mimeType = std::nullopt);

  // Registers a message without any media attached.
  void addMessageWithoutMedia(std::int64_t messageId);

  // Makes every fetchMessage call throw an UpstreamError of given kind.
  void failFetchWith(std::optional<UpstreamErrorKind> kind) { _fetchFailure = kind; }

  // Makes every streamChunks call throw an UpstreamError of given kind.
  void failStreamWith(std::optional<UpstreamErrorKind> kind) { _streamFailure = kind; }

  // Readers throw an UpstreamError of given kind after having served 'nbChunks' chunks.
  void failReadAfter(std::size_t nbChunks, UpstreamErrorKind kind) {
    _readFailure = ReadFailure{nbChunks, kind};
  }

  // Readers report the end of the sequence after 'nbChunks' chunks, whatever the window.
  void endAfter(std::size_t nbChunks) { _endAfter = nbChunks; }

  // Readers ignore the limit and serve up to the end of the media.
  void ignoreLimit(bool value = true) { _ignoreLimit = value; }

  // Readers serve an empty chunk before each data chunk.
  void interleaveEmptyChunks(bool value = true) { _interleaveEmptyChunks = value; }

  // Readers serve only empty chunks once 'nbChunks' data chunks have been served.
  void stallAfter(std::size_t nbChunks) { _stallAfter = nbChunks; }

  UpstreamMessage fetchMessage(std::int64_t messageId) override;

  std::unique_ptr<ChunkReader> streamChunks(const UpstreamMessage& message, std::uint64_t offset,
                                            std::uint64_t limit, std::size_t chunkSize) override;

  [[nodiscard]] int nbFetchCalls() const noexcept { return _nbFetchCalls.load(); }

  [[nodiscard]] int nbStreamCalls() const noexcept { return _nbStreamCalls.load(); }

  [[nodiscard]] int nbChunksServed() const noexcept { return _nbChunksServed.load(); }

  [[nodiscard]] int nbEmptyChunksServed() const noexcept { return _nbEmptyChunksServed.load(); }

  [[nodiscard]] std::uint64_t lastOffset() const noexcept { return _lastOffset.load(); }

  [[nodiscard]] std::uint64_t lastLimit() const noexcept { return _lastLimit.load(); }

  [[nodiscard]] std::size_t lastChunkSize() const noexcept { return _lastChunkSize.load(); }

 private:
  struct ReadFailure {
    std::size_t afterChunks;
    UpstreamErrorKind kind;
  };

  struct Entry {
    UpstreamMessage message;
    std::string content;
  };

  class Reader;

  std::map<std::int64_t, Entry> _entries;
  std::optional<UpstreamErrorKind> _fetchFailure;
  std::optional<UpstreamErrorKind> _streamFailure;
  std::optional<ReadFailure> _readFailure;
  std::optional<std::size_t> _endAfter;
  std::optional<std::size_t> _stallAfter;
  bool _ignoreLimit{false};
  bool _interleaveEmptyChunks{false};
  std::atomic<int> _nbFetchCalls{0};
  std::atomic<int> _nbStreamCalls{0};
  std::atomic<int> _nbChunksServed{0};
  std::atomic<int> _nbEmptyChunksServed{0};
  std::atomic<std::uint64_t> _lastOffset{0};
  std::atomic<std::uint64_t> _lastLimit{0};
  std::atomic<std::size_t> _lastChunkSize{0};
};

}  // namespace filestream::test
