#include "filestream/http-server-config.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "filestream/http-constants.hpp"
#include "filestream/http-header.hpp"
#include "filestream/string-equal-ignore-case.hpp"

namespace filestream {

namespace {

// Headers whose value is computed by the server for each response.
constexpr std::string_view kReservedHeaders[] = {http::Connection, http::ContentLength, http::TransferEncoding,
                                                 http::Date};

bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, [](char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
           std::string_view("!#$%&'*+-.^_`|~").contains(ch);
  });
}

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::none_of(value, [](char ch) { return ch == '\r' || ch == '\n' || ch == '\0'; });
}

}  // namespace

HttpServerConfig& HttpServerConfig::withGlobalHeader(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(globalHeaders,
                                 [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == globalHeaders.end()) {
    globalHeaders.emplace_back(std::string(name), std::string(value));
  } else {
    it->value.assign(value);
  }
  return *this;
}

void HttpServerConfig::validate() const {
  if (maxHeaderBytes < 16U) {
    throw std::invalid_argument("maxHeaderBytes is too small");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection should be strictly positive");
  }
  if (keepAliveTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("keepAliveTimeout should be strictly positive");
  }
  if (pollInterval <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("pollInterval should be strictly positive");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  for (const auto& [name, value] : globalHeaders) {
    if (!IsValidHeaderName(name)) {
      throw std::invalid_argument(fmt::format("header has invalid name: '{}'", name));
    }
    if (!IsValidHeaderValue(value)) {
      throw std::invalid_argument(fmt::format("header has invalid value: '{}'", value));
    }
    if (std::ranges::any_of(kReservedHeaders,
                            [&name](std::string_view reserved) { return CaseInsensitiveEqual(name, reserved); })) {
      throw std::invalid_argument(fmt::format("attempt to set reserved header: '{}'", name));
    }
  }
}

}  // namespace filestream
