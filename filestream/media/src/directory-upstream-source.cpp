#include "filestream/directory-upstream-source.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "filestream/file.hpp"
#include "filestream/log.hpp"
#include "filestream/media-payload.hpp"
#include "filestream/mime-mappings.hpp"
#include "filestream/stringconv.hpp"
#include "filestream/upstream-error.hpp"
#include "filestream/upstream-source.hpp"

namespace filestream {

namespace {

class FileChunkReader : public ChunkReader {
 public:
  FileChunkReader(File file, std::uint64_t offset, std::uint64_t remaining, std::size_t chunkSize)
      : _file(std::move(file)), _pos(offset), _remaining(remaining), _chunkSize(chunkSize) {}

  std::optional<std::string> nextChunk() override {
    if (_remaining == 0) {
      return std::nullopt;
    }
    std::string chunk(static_cast<std::size_t>(std::min<std::uint64_t>(_chunkSize, _remaining)), '\0');
    const auto nbRead = _file.readAt(std::span<char>(chunk), static_cast<std::size_t>(_pos));
    if (nbRead == File::kError) {
      throw UpstreamError(UpstreamErrorKind::TransportIo, fmt::format("Read error at offset {}", _pos));
    }
    if (nbRead == 0) {
      // file shrunk since it was opened
      _remaining = 0;
      return std::nullopt;
    }
    chunk.resize(nbRead);
    _pos += nbRead;
    _remaining -= nbRead;
    return chunk;
  }

 private:
  File _file;
  std::uint64_t _pos;
  std::uint64_t _remaining;
  std::size_t _chunkSize;
};

MediaPayload MakePayload(MediaFileInfo info) {
  const std::string_view mimeType = info.mimeType ? std::string_view(*info.mimeType) : std::string_view{};
  if (mimeType.starts_with("video/")) {
    return VideoMedia{std::move(info)};
  }
  if (mimeType.starts_with("audio/")) {
    return AudioMedia{std::move(info)};
  }
  if (mimeType == "image/gif") {
    return AnimationMedia{std::move(info)};
  }
  return DocumentMedia{std::move(info)};
}

}  // namespace

DirectoryUpstreamSource::DirectoryUpstreamSource(std::filesystem::path directory) : _directory(std::move(directory)) {
  std::error_code ec;
  if (!std::filesystem::is_directory(_directory, ec)) {
    throw std::invalid_argument(fmt::format("Media directory '{}' is not an existing directory", _directory.string()));
  }
}

std::filesystem::path DirectoryUpstreamSource::findMessageFile(std::int64_t messageId) const {
  std::string prefix = IntegralToString(messageId);
  prefix.push_back('-');

  std::error_code ec;
  std::filesystem::directory_iterator iter(_directory, ec);
  if (ec) {
    throw UpstreamError(UpstreamErrorKind::TransportIo,
                        fmt::format("Unable to list '{}': {}", _directory.string(), ec.message()));
  }
  for (const std::filesystem::directory_iterator end{}; iter != end; iter.increment(ec)) {
    if (ec) {
      throw UpstreamError(UpstreamErrorKind::TransportIo,
                          fmt::format("Unable to list '{}': {}", _directory.string(), ec.message()));
    }
    const auto& entry = *iter;
    std::error_code statusEc;
    if (entry.is_regular_file(statusEc) && entry.path().filename().string().starts_with(prefix)) {
      return entry.path();
    }
  }
  throw UpstreamError(UpstreamErrorKind::Protocol, fmt::format("Message {} not found", messageId));
}

UpstreamMessage DirectoryUpstreamSource::fetchMessage(std::int64_t messageId) {
  const auto path = findMessageFile(messageId);
  std::error_code ec;
  const auto fileSize = std::filesystem::file_size(path, ec);
  if (ec) {
    throw UpstreamError(UpstreamErrorKind::TransportIo,
                        fmt::format("Unable to get size of '{}': {}", path.string(), ec.message()));
  }

  const std::string fileName = path.filename().string();
  MediaFileInfo info;
  info.fileSize = static_cast<std::uint64_t>(fileSize);
  info.fileName = fileName.substr(fileName.find('-') + 1U);
  if (info.fileName->empty()) {
    info.fileName.reset();
  } else if (const auto mimeType = DetermineMIMETypeStr(*info.fileName); !mimeType.empty()) {
    info.mimeType.emplace(mimeType);
  }

  UpstreamMessage message{messageId, MakePayload(std::move(info))};
  log::debug("Fetched message {} ({}, {} bytes)", messageId, MediaKindToStr(MediaKindOf(*message.media)),
             fileSize);
  return message;
}

std::unique_ptr<ChunkReader> DirectoryUpstreamSource::streamChunks(const UpstreamMessage& message,
                                                                   std::uint64_t offset, std::uint64_t limit,
                                                                   std::size_t chunkSize) {
  if (chunkSize == 0) {
    throw std::invalid_argument("chunkSize should be strictly positive");
  }
  const auto path = findMessageFile(message.id);
  File file(path.string());
  if (!file) {
    throw UpstreamError(UpstreamErrorKind::TransportIo, fmt::format("Unable to open '{}'", path.string()));
  }
  const std::uint64_t fileSize = file.size();
  if (offset > fileSize) {
    throw UpstreamError(UpstreamErrorKind::OffsetInvalid,
                        fmt::format("Offset {} is past the end of message {} ({} bytes)", offset, message.id, fileSize));
  }
  std::uint64_t remaining = fileSize - offset;
  if (limit != 0) {
    remaining = std::min(remaining, limit);
  }
  return std::make_unique<FileChunkReader>(std::move(file), offset, remaining, chunkSize);
}

}  // namespace filestream
