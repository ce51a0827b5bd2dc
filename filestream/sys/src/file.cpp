#include "filestream/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>

#include "filestream/log.hpp"

namespace filestream {

namespace {

int OpenReadOnly(const char* path) {
  const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    log::error("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    return BaseFd::kClosedFd;
  }
  return fd;
}

}  // namespace

File::File(const char* path) : _fd(OpenReadOnly(path)) {
  if (!_fd) {
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    log::error("Unable to stat file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    _fd.close();
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno == EINTR) {
      continue;
    }
    log::error("pread failed on fd # {} at offset {} (errno {}: {})", _fd.fd(), offset, errno, std::strerror(errno));
    return kError;
  }
}

}  // namespace filestream
