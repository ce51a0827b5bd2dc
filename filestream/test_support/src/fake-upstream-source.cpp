#include "filestream/fake-upstream-source.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "filestream/media-payload.hpp"
#include "filestream/upstream-error.hpp"
#include "filestream/upstream-source.hpp"

namespace filestream::test {

namespace {

MediaPayload MakePayload(MediaKind kind, MediaFileInfo info) {
  switch (kind) {
    case MediaKind::Video:
      return VideoMedia{std::move(info), 60, 1280, 720};
    case MediaKind::Audio:
      return AudioMedia{std::move(info), 60, std::nullopt};
    case MediaKind::Document:
      return DocumentMedia{std::move(info)};
    case MediaKind::Animation:
      return AnimationMedia{std::move(info), 3, 320, 240};
    default:
      throw UpstreamError(UpstreamErrorKind::Other, "unknown media kind");
  }
}

}  // namespace

class FakeUpstreamSource::Reader : public ChunkReader {
 public:
  Reader(FakeUpstreamSource& source, std::string_view content, std::uint64_t pos, std::uint64_t end,
         std::size_t chunkSize)
      : _source(&source), _content(content), _pos(pos), _end(end), _chunkSize(chunkSize) {}

  std::optional<std::string> nextChunk() override {
    if (_source->_readFailure && _nbDataChunks >= _source->_readFailure->afterChunks) {
      throw UpstreamError(_source->_readFailure->kind, "scripted read failure");
    }
    if (_pos >= _end || (_source->_endAfter && _nbDataChunks >= *_source->_endAfter)) {
      return std::nullopt;
    }
    if (_source->_stallAfter && _nbDataChunks >= *_source->_stallAfter) {
      ++_source->_nbEmptyChunksServed;
      return std::string();
    }
    if (_source->_interleaveEmptyChunks && !_emptyServed) {
      _emptyServed = true;
      ++_source->_nbEmptyChunksServed;
      return std::string();
    }
    _emptyServed = false;
    const auto len = static_cast<std::size_t>(std::min<std::uint64_t>(_chunkSize, _end - _pos));
    std::string chunk(_content.substr(static_cast<std::size_t>(_pos), len));
    _pos += len;
    ++_nbDataChunks;
    ++_source->_nbChunksServed;
    return chunk;
  }

 private:
  FakeUpstreamSource* _source;
  std::string_view _content;
  std::uint64_t _pos;
  std::uint64_t _end;
  std::size_t _chunkSize;
  std::size_t _nbDataChunks{0};
  bool _emptyServed{false};
};

void FakeUpstreamSource::addMedia(std::int64_t messageId, std::string content, MediaKind kind,
                                  std::optional<std::string> fileName, std::optional<std::string> mimeType) {
  MediaFileInfo info{content.size(), std::move(fileName), std::move(mimeType)};
  Entry entry{UpstreamMessage{messageId, MakePayload(kind, std::move(info))}, std::move(content)};
  _entries.insert_or_assign(messageId, std::move(entry));
}

void FakeUpstreamSource::addMessageWithoutMedia(std::int64_t messageId) {
  _entries.insert_or_assign(messageId, Entry{UpstreamMessage{messageId, std::nullopt}, std::string()});
}

UpstreamMessage FakeUpstreamSource::fetchMessage(std::int64_t messageId) {
  ++_nbFetchCalls;
  if (_fetchFailure) {
    throw UpstreamError(*_fetchFailure, "scripted fetch failure");
  }
  const auto it = _entries.find(messageId);
  if (it == _entries.end()) {
    throw UpstreamError(UpstreamErrorKind::Protocol, "unknown message");
  }
  return it->second.message;
}

std::unique_ptr<ChunkReader> FakeUpstreamSource::streamChunks(const UpstreamMessage& message, std::uint64_t offset,
                                                              std::uint64_t limit, std::size_t chunkSize) {
  ++_nbStreamCalls;
  _lastOffset = offset;
  _lastLimit = limit;
  _lastChunkSize = chunkSize;
  if (_streamFailure) {
    throw UpstreamError(*_streamFailure, "scripted stream failure");
  }
  const auto it = _entries.find(message.id);
  if (it == _entries.end() || !it->second.message.media) {
    throw UpstreamError(UpstreamErrorKind::Protocol, "no media to stream");
  }
  const std::string& content = it->second.content;
  if (offset > content.size()) {
    throw UpstreamError(UpstreamErrorKind::OffsetInvalid, "offset beyond end of media");
  }
  std::uint64_t end = content.size();
  if (limit != 0 && !_ignoreLimit) {
    end = std::min<std::uint64_t>(end, offset + limit);
  }
  return std::make_unique<Reader>(*this, content, offset, end, chunkSize);
}

}  // namespace filestream::test
