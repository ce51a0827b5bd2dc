#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace filestream {

// Properties of a stored media object needed to answer a request.
struct ObjectMetadata {
  static constexpr std::string_view kDefaultName = "video.mp4";
  static constexpr std::string_view kDefaultMimeType = "video/mp4";

  bool operator==(const ObjectMetadata&) const noexcept = default;

  std::uint64_t size{};
  std::string name{kDefaultName};
  std::string mimeType{kDefaultMimeType};
};

}  // namespace filestream
