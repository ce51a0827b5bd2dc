#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace filestream::test {

// Unique temporary directory under the system temp directory, removed (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "filestream-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// Temporary file with a chosen name, either in its own temporary directory (removed with it),
// or in an existing ScopedTempDir (which keeps ownership of the directory).
class ScopedTempFile {
 public:
  ScopedTempFile(std::string_view name, std::string_view content);

  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content);

  // File of given size filled with a repeating 'a'..'z' pattern, retrievable with content().
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::uint64_t size);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] std::string filename() const { return _path.filename().string(); }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void write();
  void cleanup() noexcept;

  std::filesystem::path _ownedDir;
  std::filesystem::path _path;
  std::string _content;
};

}  // namespace filestream::test
