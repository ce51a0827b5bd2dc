#include "filestream/temp-file.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "filestream/base-fd.hpp"
#include "filestream/log.hpp"

namespace filestream::test {

namespace {

std::string RandomSuffix() {
  static constexpr std::string_view kChars = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> dist(0, kChars.size() - 1U);
  std::string ret(16, '0');
  for (auto& ch : ret) {
    ch = kChars[dist(engine)];
  }
  return ret;
}

std::filesystem::path CreateUniqueDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / (std::string(prefix) + RandomSuffix());
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      return candidate;
    }
  }
  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

std::string Pattern(std::uint64_t size) {
  std::string ret(static_cast<std::size_t>(size), '\0');
  for (std::size_t pos = 0; pos < ret.size(); ++pos) {
    ret[pos] = static_cast<char>('a' + (pos % 26U));
  }
  return ret;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) : _dir(CreateUniqueDir(prefix)) {}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::exchange(other._dir, {})) {}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::exchange(other._dir, {});
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir: unable to remove '{}': {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(std::string_view name, std::string_view content)
    : _ownedDir(CreateUniqueDir("filestream-temp-file-")), _path(_ownedDir / name), _content(content) {
  write();
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content)
    : _path(dir.dirPath() / name), _content(content) {
  write();
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::uint64_t size)
    : _path(dir.dirPath() / name), _content(Pattern(size)) {
  write();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : _ownedDir(std::exchange(other._ownedDir, {})),
      _path(std::exchange(other._path, {})),
      _content(std::move(other._content)) {}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _ownedDir = std::exchange(other._ownedDir, {});
    _path = std::exchange(other._path, {});
    _content = std::move(other._content);
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::write() {
  BaseFd fd(::open(_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!fd) {
    const int err = errno;
    cleanup();
    throw std::system_error(err, std::generic_category(), "ScopedTempFile: open failed");
  }
  std::string_view remaining(_content);
  while (!remaining.empty()) {
    const auto written = ::write(fd.fd(), remaining.data(), remaining.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int err = errno;
      fd.close();
      cleanup();
      throw std::system_error(err, std::generic_category(), "ScopedTempFile: write failed");
    }
    remaining.remove_prefix(static_cast<std::size_t>(written));
  }
}

void ScopedTempFile::cleanup() noexcept {
  std::error_code ec;
  if (!_ownedDir.empty()) {
    std::filesystem::remove_all(_ownedDir, ec);
    _ownedDir.clear();
  } else if (!_path.empty()) {
    std::filesystem::remove(_path, ec);
  }
  if (ec) {
    log::error("ScopedTempFile: unable to remove '{}': {}", _path.string(), ec.message());
  }
  _path.clear();
}

}  // namespace filestream::test
