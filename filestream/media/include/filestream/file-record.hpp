#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <glaze/glaze.hpp>

namespace filestream {

// Record of the lookup store describing a stored media object.
struct FileRecord {
  // Reference of the upstream message holding the media: 'file_id', or 'message_id' if 'file_id' is absent or 0.
  [[nodiscard]] std::optional<std::int64_t> messageRef() const noexcept {
    if (fileId && *fileId != 0) {
      return fileId;
    }
    return messageId;
  }

  std::string id;
  std::optional<std::int64_t> fileId;
  std::optional<std::int64_t> messageId;
  std::optional<std::uint64_t> fileSize;
  std::optional<std::string> fileName;
  std::optional<std::string> mimeType;
  std::optional<std::string> animeTitle;
  std::optional<std::string> poster;
  std::optional<std::vector<std::string>> genres;
  std::optional<std::string> quality;
  std::optional<std::string> driveId;
};

}  // namespace filestream

template <>
struct glz::meta<filestream::FileRecord> {
  using T = filestream::FileRecord;
  static constexpr auto value =
      glz::object("id", &T::id, "file_id", &T::fileId, "message_id", &T::messageId, "file_size", &T::fileSize,
                  "file_name", &T::fileName, "mime_type", &T::mimeType, "anime_title", &T::animeTitle, "poster",
                  &T::poster, "genres", &T::genres, "quality", &T::quality, "drive_id", &T::driveId);
};
