#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "filestream/file-record.hpp"
#include "filestream/lookup-store.hpp"

namespace filestream::test {

// LookupStore backed by a plain map, with an optional failure mode simulating an unavailable store.
class InMemoryLookupStore : public LookupStore {
 public:
  void add(FileRecord record) {
    std::string id = record.id;
    _records.insert_or_assign(std::move(id), std::move(record));
  }

  // When set, every getFile call throws std::runtime_error with given message.
  void failWith(std::optional<std::string> message) { _failure = std::move(message); }

  [[nodiscard]] std::optional<FileRecord> getFile(std::string_view id) const override;

  [[nodiscard]] int nbLookups() const noexcept { return _nbLookups.load(); }

 private:
  std::map<std::string, FileRecord, std::less<>> _records;
  std::optional<std::string> _failure;
  mutable std::atomic<int> _nbLookups{0};
};

}  // namespace filestream::test
