#include "filestream/mime-mappings.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>

#include "filestream/string-equal-ignore-case.hpp"

namespace filestream {

namespace {

constexpr std::size_t kMaxExtensionLen = 8;

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");
static_assert(std::size(kMIMEMappings) < kUnknownMIMEMappingIdx, "MIMETypeIdx too small");

}  // namespace

MIMETypeIdx DetermineMIMETypeIdx(std::string_view fileName) {
  const auto dotPos = fileName.rfind('.');
  if (dotPos == std::string_view::npos) {
    return kUnknownMIMEMappingIdx;
  }
  const std::string_view ext = fileName.substr(dotPos + 1);
  if (ext.empty() || ext.size() > kMaxExtensionLen) {
    return kUnknownMIMEMappingIdx;
  }

  std::array<char, kMaxExtensionLen> lowerBuf;
  std::ranges::transform(ext, lowerBuf.begin(), AsciiToLower);
  const std::string_view lowerExt(lowerBuf.data(), ext.size());

  const auto it = std::ranges::lower_bound(kMIMEMappings, lowerExt, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == lowerExt) {
    return static_cast<MIMETypeIdx>(std::distance(std::begin(kMIMEMappings), it));
  }
  return kUnknownMIMEMappingIdx;
}

std::string_view DetermineMIMETypeStr(std::string_view fileName) {
  const auto idx = DetermineMIMETypeIdx(fileName);
  if (idx == kUnknownMIMEMappingIdx) {
    return {};
  }
  return kMIMEMappings[idx].mimeType;
}

}  // namespace filestream
