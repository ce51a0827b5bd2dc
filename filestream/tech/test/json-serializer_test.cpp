#include "filestream/json-serializer.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct StatusMessage {
  std::string status;
};

struct Entry {
  std::string name;
  std::optional<std::string> comment;
  std::vector<int> values;
};

}  // namespace

template <>
struct glz::meta<StatusMessage> {
  using T = StatusMessage;
  static constexpr auto value = glz::object("status", &T::status);
};

template <>
struct glz::meta<Entry> {
  using T = Entry;
  static constexpr auto value = glz::object("name", &T::name, "comment", &T::comment, "values", &T::values);
};

namespace filestream {

TEST(JsonSerializer, SerializeSimpleMessage) {
  EXPECT_EQ(SerializeToJson(StatusMessage{"running"}), R"({"status":"running"})");
}

TEST(JsonSerializer, NullsAreSkippedByDefault) {
  Entry entry{"a", std::nullopt, {1, 2}};
  EXPECT_EQ(SerializeToJson(entry), R"({"name":"a","values":[1,2]})");
  EXPECT_EQ(SerializeToJsonWithNulls(entry), R"({"name":"a","comment":null,"values":[1,2]})");
}

TEST(JsonSerializer, ParseIgnoresUnknownKeys) {
  Entry entry;
  ParseJsonOrThrow(R"({"name":"b","extra":true,"values":[3]})", entry);
  EXPECT_EQ(entry.name, "b");
  EXPECT_FALSE(entry.comment);
  EXPECT_EQ(entry.values, std::vector<int>{3});
}

TEST(JsonSerializer, ParseThrowsOnMalformedDocument) {
  Entry entry;
  EXPECT_THROW(ParseJsonOrThrow(R"({"name":)", entry), std::invalid_argument);
}

}  // namespace filestream
