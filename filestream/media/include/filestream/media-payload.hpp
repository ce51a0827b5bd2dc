#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace filestream {

// File properties shared by all media kinds.
struct MediaFileInfo {
  std::uint64_t fileSize{};
  std::optional<std::string> fileName;
  std::optional<std::string> mimeType;
};

struct VideoMedia {
  MediaFileInfo file;
  std::uint32_t durationSeconds{};
  std::uint32_t width{};
  std::uint32_t height{};
};

struct AudioMedia {
  MediaFileInfo file;
  std::uint32_t durationSeconds{};
  std::optional<std::string> performer;
};

struct DocumentMedia {
  MediaFileInfo file;
};

struct AnimationMedia {
  MediaFileInfo file;
  std::uint32_t durationSeconds{};
  std::uint32_t width{};
  std::uint32_t height{};
};

// Media attached to an upstream message. The alternative index is the media kind.
using MediaPayload = std::variant<VideoMedia, AudioMedia, DocumentMedia, AnimationMedia>;

enum class MediaKind : std::uint8_t { Video, Audio, Document, Animation };

[[nodiscard]] inline MediaKind MediaKindOf(const MediaPayload& payload) noexcept {
  return static_cast<MediaKind>(payload.index());
}

[[nodiscard]] inline const MediaFileInfo& FileInfoOf(const MediaPayload& payload) noexcept {
  return std::visit([](const auto& media) -> const MediaFileInfo& { return media.file; }, payload);
}

[[nodiscard]] std::string_view MediaKindToStr(MediaKind kind) noexcept;

// Opaque handle on an upstream message, as returned by UpstreamSource::fetchMessage.
struct UpstreamMessage {
  std::int64_t id{};
  // Absent if the message does not carry any media.
  std::optional<MediaPayload> media;
};

}  // namespace filestream
