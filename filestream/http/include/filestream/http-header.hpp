#pragma once

#include <string>

namespace filestream::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

}  // namespace filestream::http
