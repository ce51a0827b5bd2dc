#include "filestream/stringconv.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace filestream {

TEST(StringConv, IntegralToString) {
  EXPECT_EQ(IntegralToString(0), "0");
  EXPECT_EQ(IntegralToString(-42), "-42");
  EXPECT_EQ(IntegralToString(std::numeric_limits<std::uint64_t>::max()), "18446744073709551615");
  EXPECT_EQ(IntegralToString(std::numeric_limits<std::int64_t>::min()), "-9223372036854775808");
}

TEST(StringConv, TryStringToIntegralStrict) {
  EXPECT_EQ(TryStringToIntegral<std::uint64_t>("1000"), 1000U);
  EXPECT_FALSE(TryStringToIntegral<std::uint64_t>(""));
  EXPECT_FALSE(TryStringToIntegral<std::uint64_t>("12a"));
  EXPECT_FALSE(TryStringToIntegral<std::uint64_t>(" 12"));
  EXPECT_FALSE(TryStringToIntegral<std::uint64_t>("+12"));
  EXPECT_FALSE(TryStringToIntegral<std::int64_t>("-12"));
  EXPECT_FALSE(TryStringToIntegral<std::uint64_t>("18446744073709551616"));
}

TEST(StringConv, StringToIntegralThrowsOnError) {
  EXPECT_EQ(StringToIntegral<std::uint16_t>("8080"), 8080);
  EXPECT_THROW(StringToIntegral<std::uint16_t>("70000"), std::invalid_argument);
  EXPECT_THROW(StringToIntegral<int>("abc"), std::invalid_argument);
}

}  // namespace filestream
