#include "filestream/timestring.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <string>

#include "filestream/timedef.hpp"

namespace filestream {

std::string TimeToStringRFC7231(SysTimePoint tp) {
  const std::time_t secs = SysClock::to_time_t(tp);
  std::tm utc{};
  if (::gmtime_r(&secs, &utc) == nullptr) {
    throw std::runtime_error("gmtime_r failed");
  }
  std::array<char, 32> buf;
  const auto len = std::strftime(buf.data(), buf.size(), "%a, %d %b %Y %H:%M:%S GMT", &utc);
  return {buf.data(), len};
}

}  // namespace filestream
