#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <stdexcept>
#include <string>
#include <string_view>

namespace filestream {

/// Serialize a C++ object to JSON string using glaze.
/// Type T must be known to glaze (aggregate reflection or glz::meta specialization).
/// Absent optionals are omitted from the output.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

/// Same as SerializeToJson, but absent optionals are written as 'null'.
template <typename T>
[[nodiscard]] inline std::string SerializeToJsonWithNulls(const T& obj) {
  return glz::write<glz::opts{.skip_null_members = false}>(obj).value_or(std::string{});
}

/// Parse a JSON document into 'obj', ignoring keys unknown to the target type.
/// Throws std::invalid_argument with a descriptive message on error.
template <typename T>
void ParseJsonOrThrow(std::string_view json, T& obj) {
  std::string buffer(json);
  const auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(obj, buffer);
  if (ec) {
    throw std::invalid_argument(glz::format_error(ec, buffer));
  }
}

}  // namespace filestream
