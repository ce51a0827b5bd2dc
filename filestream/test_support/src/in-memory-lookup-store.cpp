#include "filestream/in-memory-lookup-store.hpp"

#include <optional>
#include <stdexcept>
#include <string_view>

#include "filestream/file-record.hpp"

namespace filestream::test {

std::optional<FileRecord> InMemoryLookupStore::getFile(std::string_view id) const {
  ++_nbLookups;
  if (_failure) {
    throw std::runtime_error(*_failure);
  }
  const auto it = _records.find(id);
  if (it == _records.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace filestream::test
