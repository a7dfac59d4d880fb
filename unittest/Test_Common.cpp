#include "Common.hpp"
#include "Stats.hpp"
#include "TestHarness.hpp"

using namespace hs;

TEST(Djb2, KnownValues)
{
  EXPECT_EQ(5381u, Djb2Hash(""));
  EXPECT_EQ(177670u, Djb2Hash("a"));
  EXPECT_EQ(3007235198u, Djb2Hash("FooBar"));
}

TEST(Djb2, HighBytesAreUnsigned)
{
  EXPECT_EQ(5381u * 33 + 0xE9, Djb2Hash("\xE9"));
  EXPECT_NE(Djb2Hash("setup.exe"), Djb2Hash("SETUP.EXE"));
}

TEST(StrNoCase, Equality)
{
  EXPECT_TRUE(StrEqualNoCase("900150983cd24fb0", "900150983CD24FB0"));
  EXPECT_TRUE(StrEqualNoCase("", ""));
  EXPECT_FALSE(StrEqualNoCase("abc", "abcd"));
  EXPECT_FALSE(StrEqualNoCase("abcd", "abc"));
  EXPECT_FALSE(StrEqualNoCase("a[", "a{"));
}

TEST(StrNoCase, Prefix)
{
  EXPECT_TRUE(StrHasPrefixNoCase("/Data/Files/x", "/data/"));
  EXPECT_TRUE(StrHasPrefixNoCase("anything", ""));
  EXPECT_FALSE(StrHasPrefixNoCase("/da", "/data"));
}

TEST(StrCase, LowerInPlace)
{
  char name[] = "Setup-1.EXE";
  StrLowerInPlace(name);
  EXPECT_STREQ("setup-1.exe", name);

  char utf8[] = "\xC3\x89T\xC3\x89.TXT";
  StrLowerInPlace(utf8);
  EXPECT_STREQ("\xC3\x89t\xC3\x89.txt", utf8);
}

TEST(StrNoCase, HighBytesCompareExactly)
{
  EXPECT_FALSE(StrEqualNoCase("\xC3\x89", "\xC3\xA9"));
  EXPECT_TRUE(StrEqualNoCase("\xC3\x89X", "\xC3\x89x"));
}

TEST(Timestamp, Utc)
{
  char buffer[kTimestampStringSize];

  FormatUtcTimestamp(buffer, 0);
  EXPECT_STREQ("1970-01-01T00:00:00Z", buffer);

  FormatUtcTimestamp(buffer, 951782400);
  EXPECT_STREQ("2000-02-29T00:00:00Z", buffer);

  FormatUtcTimestamp(buffer, 1700000000);
  EXPECT_STREQ("2023-11-14T22:13:20Z", buffer);
}

TEST(Timer, Monotonic)
{
  uint64_t a = TimerGet();
  uint64_t b = TimerGet();
  EXPECT_LE(a, b);
  EXPECT_DOUBLE_EQ(1.5, TimerDiffSeconds(1000000, 2500000));
}

TEST(RunStats, AverageWithoutFilesIsZero)
{
  RunStats stats;
  RunStatsInit(&stats);
  stats.m_EndTime = stats.m_StartTime + 2000000;

  EXPECT_DOUBLE_EQ(2.0, RunStatsElapsedSeconds(&stats));
  EXPECT_DOUBLE_EQ(0.0, RunStatsAverageFileSeconds(&stats));

  stats.m_FilesProcessed = 4;
  EXPECT_DOUBLE_EQ(0.5, RunStatsAverageFileSeconds(&stats));
}

TEST(RunStats, TimingScopeAccumulates)
{
  uint32_t count = 0;
  uint64_t micros = 0;
  {
    TimingScope scope(&count, &micros);
  }
  {
    TimingScope scope(nullptr, &micros);
  }
  EXPECT_EQ(1u, count);
}
