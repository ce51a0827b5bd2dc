#pragma once

#include <string>

#include "filestream/timedef.hpp"

namespace filestream {

// Formats given time point as an RFC 7231 IMF-fixdate, as used in the HTTP 'Date' header.
// Example: "Sun, 06 Nov 1994 08:49:37 GMT"
[[nodiscard]] std::string TimeToStringRFC7231(SysTimePoint tp);

}  // namespace filestream
