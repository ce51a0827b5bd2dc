#include "filestream/metadata-resolver.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "filestream/file-record.hpp"
#include "filestream/log.hpp"
#include "filestream/media-payload.hpp"
#include "filestream/object-metadata.hpp"
#include "filestream/upstream-error.hpp"

namespace filestream {

namespace {

std::string ValueOrDefault(const std::optional<std::string>& value, std::string_view defaultValue) {
  if (value && !value->empty()) {
    return *value;
  }
  return std::string(defaultValue);
}

ObjectMetadata FromRecord(const FileRecord& record) {
  return ObjectMetadata{record.fileSize.value_or(0),
                        ValueOrDefault(record.fileName, ObjectMetadata::kDefaultName),
                        ValueOrDefault(record.mimeType, ObjectMetadata::kDefaultMimeType)};
}

ObjectMetadata FromPayload(const MediaPayload& payload) {
  const MediaFileInfo& info = FileInfoOf(payload);
  return ObjectMetadata{info.fileSize, ValueOrDefault(info.fileName, ObjectMetadata::kDefaultName),
                        ValueOrDefault(info.mimeType, ObjectMetadata::kDefaultMimeType)};
}

}  // namespace

std::optional<ResolvedObject> MetadataResolver::resolve(std::string_view id) const {
  auto record = _store->getFile(id);
  if (!record) {
    log::debug("File '{}' not found in lookup store", id);
    return std::nullopt;
  }

  ResolvedObject resolved;
  resolved.messageRef = record->messageRef();
  if (resolved.messageRef) {
    resolved.message = fetchLive(id, *resolved.messageRef);
  } else {
    log::warn("File '{}' has no upstream message reference, using stored fields", id);
  }

  if (resolved.message) {
    resolved.metadata = FromPayload(*resolved.message->media);
  } else {
    resolved.metadata = FromRecord(*record);
  }
  resolved.record = std::move(*record);
  return resolved;
}

std::optional<UpstreamMessage> MetadataResolver::fetchLive(std::string_view id, std::int64_t messageRef) const {
  try {
    auto message = _upstream->fetchMessage(messageRef);
    if (!message.media) {
      log::warn("Upstream message {} of file '{}' has no media, using stored fields", messageRef, id);
      return std::nullopt;
    }
    return message;
  } catch (const UpstreamError& ex) {
    if (ex.isExpected()) {
      log::warn("Live lookup of message {} of file '{}' failed ({}): {}, using stored fields", messageRef, id,
                UpstreamErrorKindToStr(ex.kind()), ex.what());
    } else {
      log::error("Live lookup of message {} of file '{}' failed: {}, using stored fields", messageRef, id, ex.what());
    }
  } catch (const std::exception& ex) {
    log::error("Unexpected error during live lookup of message {} of file '{}': {}, using stored fields", messageRef,
               id, ex.what());
  }
  return std::nullopt;
}

}  // namespace filestream
