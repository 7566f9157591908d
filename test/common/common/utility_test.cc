#include <chrono>
#include <string>
#include <vector>

#include "source/common/common/utility.h"

#include "test/mocks/common.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::ElementsAre;
using testing::Return;

namespace Unseal {

// 2024-03-05T14:07:09Z
const SystemTime FixedTime{std::chrono::seconds(1709647629)};

TEST(DateFormatter, FromTimeUtc) {
  const DateFormatter formatter("%a %b %e %H:%M:%S %Z %Y");
  EXPECT_EQ("Tue Mar  5 14:07:09 UTC 2024", formatter.fromTime(FixedTime));
}

TEST(DateFormatter, EmptyFormat) {
  const DateFormatter formatter("");
  EXPECT_EQ("", formatter.fromTime(FixedTime));
}

TEST(DateFormatter, NowUsesTimeSource) {
  MockTimeSource time_source;
  EXPECT_CALL(time_source, systemTime()).WillOnce(Return(FixedTime));
  const DateFormatter formatter("%Y-%m-%dT%H:%M:%S");
  EXPECT_EQ("2024-03-05T14:07:09", formatter.now(time_source));
}

TEST(DateFormatter, LocalTimeKeepsYear) {
  // The local zone is whatever the host uses, so only the date part that can't shift is checked.
  const DateFormatter formatter("%Y", true);
  EXPECT_EQ("2024", formatter.fromTime(FixedTime));
}

TEST(StringUtil, Trim) {
  EXPECT_EQ("hello", StringUtil::ltrim("  \thello"));
  EXPECT_EQ("hello", StringUtil::rtrim("hello \r\n"));
  EXPECT_EQ("hello world", StringUtil::trim("\f hello world \v"));
  EXPECT_EQ("", StringUtil::trim(" \t "));
  EXPECT_EQ("", StringUtil::trim(""));
}

TEST(StringUtil, RemoveTrailingCharacters) {
  EXPECT_EQ("value", StringUtil::removeTrailingCharacters("value///", '/'));
  EXPECT_EQ("", StringUtil::removeTrailingCharacters("///", '/'));
  EXPECT_EQ("value", StringUtil::removeTrailingCharacters("value\r\n\n", "\r\n"));
  EXPECT_EQ("va\nlue", StringUtil::removeTrailingCharacters("va\nlue\n", "\r\n"));
  EXPECT_EQ("value ", StringUtil::removeTrailingCharacters("value \r\n", "\r\n"));
}

TEST(StringUtil, FindToken) {
  EXPECT_TRUE(StringUtil::findToken("nova-api", "-_.", "nova"));
  EXPECT_TRUE(StringUtil::findToken("heat_engine", "-_.", "engine"));
  EXPECT_TRUE(StringUtil::findToken("neutron-server.sh", "-_.", "sh"));
  EXPECT_FALSE(StringUtil::findToken("novaapi", "-_.", "nova"));
  EXPECT_FALSE(StringUtil::findToken("", "-_.", "nova"));
}

TEST(StringUtil, SplitToken) {
  EXPECT_THAT(StringUtil::splitToken("a--b_c", "-_"), ElementsAre("a", "b", "c"));
  EXPECT_THAT(StringUtil::splitToken("a--b", "-", true), ElementsAre("a", "", "b"));
  EXPECT_THAT(StringUtil::splitToken(" a , b ", ",", false, true), ElementsAre("a", "b"));
  EXPECT_TRUE(StringUtil::splitToken("", "-").empty());
}

} // namespace Unseal
