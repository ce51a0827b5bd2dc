#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "filestream/base-fd.hpp"

namespace filestream {

// Read-only regular file accessed with positional reads.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path in read-only mode.
  // On failure (logged), operator bool() returns false.
  explicit File(const std::string& path) : File(path.c_str()) {}

  // Open a file by path (must be null-terminated) in read-only mode.
  // On failure (logged), operator bool() returns false.
  explicit File(const char* path);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the file size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read up to dst.size() bytes starting at the given absolute offset.
  // Uses pread() so that it does not modify the file's current offset.
  // Returns the number of bytes read (0 on EOF). Returns kError on error (errno is set).
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

 private:
  BaseFd _fd;
  std::size_t _fileSize{kError};
};

}  // namespace filestream
