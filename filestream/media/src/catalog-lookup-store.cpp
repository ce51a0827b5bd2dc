#include "filestream/catalog-lookup-store.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glaze/glaze.hpp>
#include <spdlog/fmt/fmt.h>

#include "filestream/file-record.hpp"
#include "filestream/file.hpp"
#include "filestream/json-serializer.hpp"
#include "filestream/log.hpp"

namespace filestream {

namespace {

struct Catalog {
  std::vector<FileRecord> files;
};

}  // namespace

}  // namespace filestream

template <>
struct glz::meta<filestream::Catalog> {
  using T = filestream::Catalog;
  static constexpr auto value = glz::object("files", &T::files);
};

namespace filestream {

CatalogLookupStore::CatalogLookupStore(std::vector<FileRecord> records) {
  for (auto& record : records) {
    if (record.id.empty()) {
      throw std::invalid_argument("Catalog record with an empty id");
    }
    std::string id = record.id;
    const auto [it, inserted] = _records.emplace(std::move(id), std::move(record));
    if (!inserted) {
      throw std::invalid_argument(fmt::format("Duplicated catalog record id '{}'", it->first));
    }
  }
}

CatalogLookupStore CatalogLookupStore::FromJson(std::string_view json) {
  Catalog catalog;
  ParseJsonOrThrow(json, catalog);
  return CatalogLookupStore(std::move(catalog.files));
}

CatalogLookupStore CatalogLookupStore::FromFile(const std::string& path) {
  const File file(path);
  if (!file) {
    throw std::invalid_argument(fmt::format("Unable to open catalog file '{}'", path));
  }
  std::string content(file.size(), '\0');
  std::size_t pos = 0;
  while (pos < content.size()) {
    const auto nbRead = file.readAt(std::span<char>(content).subspan(pos), pos);
    if (nbRead == File::kError) {
      throw std::invalid_argument(fmt::format("Unable to read catalog file '{}'", path));
    }
    if (nbRead == 0) {
      break;
    }
    pos += nbRead;
  }
  content.resize(pos);
  auto store = FromJson(content);
  log::info("Loaded {} file record(s) from catalog '{}'", store.size(), path);
  return store;
}

std::optional<FileRecord> CatalogLookupStore::getFile(std::string_view id) const {
  const auto it = _records.find(id);
  if (it == _records.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace filestream
