#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "filestream/file-record.hpp"
#include "filestream/lookup-store.hpp"

namespace filestream {

// Immutable lookup store loaded from a JSON catalog of the form {"files": [ {"id": "...", ...}, ... ]}.
// Record keys follow the snake_case names of the lookup store ('file_id', 'file_size', 'anime_title'...),
// unknown keys are ignored.
class CatalogLookupStore : public LookupStore {
 public:
  // Throws std::invalid_argument if a record has an empty or duplicated id.
  explicit CatalogLookupStore(std::vector<FileRecord> records);

  // Parses given JSON catalog. Throws std::invalid_argument if it is malformed.
  static CatalogLookupStore FromJson(std::string_view json);

  // Reads and parses the JSON catalog file at given path. Throws std::invalid_argument on failure.
  static CatalogLookupStore FromFile(const std::string& path);

  [[nodiscard]] std::optional<FileRecord> getFile(std::string_view id) const override;

  [[nodiscard]] std::size_t size() const noexcept { return _records.size(); }

 private:
  std::map<std::string, FileRecord, std::less<>> _records;
};

}  // namespace filestream
