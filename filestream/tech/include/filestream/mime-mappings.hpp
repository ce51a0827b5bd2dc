#pragma once

#include <cstdint>
#include <string_view>

namespace filestream {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

using MIMETypeIdx = uint8_t;

inline constexpr MIMETypeIdx kUnknownMIMEMappingIdx = static_cast<MIMETypeIdx>(~0);

// Sorted by extension (lower case), looked up by binary search.
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"3gp", "video/3gpp"},
    {"7z", "application/x-7z-compressed"},
    {"aac", "audio/aac"},
    {"ass", "text/x-ssa"},
    {"avi", "video/x-msvideo"},
    {"flac", "audio/flac"},
    {"flv", "video/x-flv"},
    {"gif", "image/gif"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"json", "application/json"},
    {"m3u8", "application/vnd.apple.mpegurl"},
    {"m4a", "audio/mp4"},
    {"m4v", "video/x-m4v"},
    {"mka", "audio/x-matroska"},
    {"mkv", "video/x-matroska"},
    {"mov", "video/quicktime"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"mpeg", "video/mpeg"},
    {"mpg", "video/mpeg"},
    {"oga", "audio/ogg"},
    {"ogg", "audio/ogg"},
    {"ogv", "video/ogg"},
    {"opus", "audio/opus"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"rar", "application/vnd.rar"},
    {"srt", "application/x-subrip"},
    {"ts", "video/mp2t"},
    {"txt", "text/plain"},
    {"vtt", "text/vtt"},
    {"wav", "audio/wav"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"wmv", "video/x-ms-wmv"},
    {"zip", "application/zip"},
};

// Returns the index in kMIMEMappings of the extension of given file name (case insensitive),
// or kUnknownMIMEMappingIdx if the extension is absent or unknown.
[[nodiscard]] MIMETypeIdx DetermineMIMETypeIdx(std::string_view fileName);

// Returns the MIME type of given file name, or an empty string_view if unknown.
[[nodiscard]] std::string_view DetermineMIMETypeStr(std::string_view fileName);

}  // namespace filestream
