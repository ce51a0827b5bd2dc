#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "filestream/file-record.hpp"
#include "filestream/lookup-store.hpp"
#include "filestream/media-payload.hpp"
#include "filestream/object-metadata.hpp"
#include "filestream/upstream-source.hpp"

namespace filestream {

struct ResolvedObject {
  ObjectMetadata metadata;
  FileRecord record;
  std::optional<std::int64_t> messageRef;
  // Live handle fetched during resolution, absent if the live lookup failed.
  std::optional<UpstreamMessage> message;
};

// Resolves an object ID into the metadata needed to serve it.
// The lookup store is authoritative for existence. Size, name and MIME type come from a live upstream lookup,
// falling back on the stored fields of the record when it fails.
class MetadataResolver {
 public:
  MetadataResolver(const LookupStore& store, UpstreamSource& upstream) noexcept
      : _store(&store), _upstream(&upstream) {}

  // Returns std::nullopt if the id is unknown to the lookup store.
  // Exceptions thrown by the lookup store are propagated. Upstream failures never are.
  [[nodiscard]] std::optional<ResolvedObject> resolve(std::string_view id) const;

 private:
  [[nodiscard]] std::optional<UpstreamMessage> fetchLive(std::string_view id, std::int64_t messageRef) const;

  const LookupStore* _store;
  UpstreamSource* _upstream;
};

}  // namespace filestream
