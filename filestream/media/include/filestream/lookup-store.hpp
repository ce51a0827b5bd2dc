#pragma once

#include <optional>
#include <string_view>

#include "filestream/file-record.hpp"

namespace filestream {

// Store of file records, addressed by their opaque ID.
class LookupStore {
 public:
  virtual ~LookupStore() = default;

  // Returns the record of given id, or std::nullopt if unknown.
  [[nodiscard]] virtual std::optional<FileRecord> getFile(std::string_view id) const = 0;
};

}  // namespace filestream
