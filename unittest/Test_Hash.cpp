#include "Hash.hpp"
#include "TestHarness.hpp"

#include <string.h>

using namespace hs;

static const char* const s_AbcDigests[HashAlgorithm::kCount] =
{
  "900150983CD24FB0D6963F7D28E17F72",
  "A9993E364706816ABA3E25717850C26C9CD0D89D",
  "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD",
  "DDAF35A193617ABACC417349AE20413112E6FA4E89A97EA20A9EEEE64B55D39A"
  "2192992A274FC1A836BA3C23A3FEEBBD454D4423643CE80E2A9AC94FA54CA49F",
};

// 219 bytes of (i * 7 + 3) & 0xff, digests from coreutils.
static const char* const s_FixtureDigests[HashAlgorithm::kCount] =
{
  "83947C942741FB2C0427819F99007500",
  "61F4CFF2E07F766E69CE56C3535CF91A387CF5F2",
  "8C2B5D368527E9C12A54A9FF3B9C8EBFDB3070CE2613030AA426E04DBCEA0E8C",
  "1531BBE474B2699F25DF828F1497FFD075CD82D666AC8E7E556887CF700EA8AE"
  "3ACB02412DE0B445178D18CB9B2B2123DC5E26B0BF165C911D37D548F95ECC64",
};

static void MakeFixture(uint8_t (&data)[219])
{
  for (int i = 0; i < 219; ++i)
    data[i] = uint8_t(i * 7 + 3);
}

TEST(HashTest, KnownAnswerAbc)
{
  char error[256];
  DigestEngine engine;
  DigestResult result;

  ASSERT_TRUE(DigestEngineInit(&engine, kAllHashAlgorithms, error, sizeof error)) << error;
  ASSERT_TRUE(DigestEngineUpdate(&engine, "abc", 3, error, sizeof error)) << error;
  ASSERT_TRUE(DigestEngineFinalize(&engine, &result, error, sizeof error)) << error;
  DigestEngineDestroy(&engine);

  EXPECT_EQ(3u, result.m_BytesHashed);
  for (int a = 0; a < HashAlgorithm::kCount; ++a)
    EXPECT_STREQ(s_AbcDigests[a], DigestResultGet(&result, HashAlgorithm::Enum(a))) << HashAlgorithm::Names[a];
}

TEST(HashTest, FixtureFromFile)
{
  TestDirectory dir;
  uint8_t data[219];
  MakeFixture(data);
  dir.WriteFile("fixture.bin", data, sizeof data);

  char path[kTestPathSize];
  dir.Join(path, "fixture.bin");

  char error[256];
  DigestResult result;
  ASSERT_EQ(DigestStatus::kOk, DigestFile(path, kAllHashAlgorithms, &result, error, sizeof error)) << error;

  EXPECT_EQ(219u, result.m_BytesHashed);
  for (int a = 0; a < HashAlgorithm::kCount; ++a)
  {
    const char* hex = DigestResultGet(&result, HashAlgorithm::Enum(a));
    EXPECT_STREQ(s_FixtureDigests[a], hex);
    EXPECT_EQ(HashAlgorithmHexLength(HashAlgorithm::Enum(a)), strlen(hex));
  }
}

TEST(HashTest, SinglePassMatchesSeparateRuns)
{
  uint8_t data[219];
  MakeFixture(data);
  char error[256];

  for (int a = 0; a < HashAlgorithm::kCount; ++a)
  {
    DigestEngine engine;
    DigestResult result;
    uint32_t     only = HashAlgorithmBit(HashAlgorithm::Enum(a));

    ASSERT_TRUE(DigestEngineInit(&engine, only, error, sizeof error));
    // Uneven chunks must not change the result.
    ASSERT_TRUE(DigestEngineUpdate(&engine, data, 100, error, sizeof error));
    ASSERT_TRUE(DigestEngineUpdate(&engine, data + 100, 1, error, sizeof error));
    ASSERT_TRUE(DigestEngineUpdate(&engine, data + 101, 118, error, sizeof error));
    ASSERT_TRUE(DigestEngineFinalize(&engine, &result, error, sizeof error));
    DigestEngineDestroy(&engine);

    EXPECT_EQ(only, result.m_Algorithms);
    EXPECT_STREQ(s_FixtureDigests[a], DigestResultGet(&result, HashAlgorithm::Enum(a)));

    for (int other = 0; other < HashAlgorithm::kCount; ++other)
    {
      if (other != a)
        EXPECT_EQ(nullptr, DigestResultGet(&result, HashAlgorithm::Enum(other)));
    }
  }
}

TEST(HashTest, HexIsUppercase)
{
  const uint8_t bytes[] = { 0x00, 0xab, 0x7f, 0xff };
  char hex[2 * sizeof bytes + 1];
  DigestToHex(bytes, sizeof bytes, hex);
  EXPECT_STREQ("00AB7FFF", hex);
}

TEST(HashTest, AlgorithmNames)
{
  HashAlgorithm::Enum algo;

  ASSERT_TRUE(HashAlgorithmFromName("md5", &algo));
  EXPECT_EQ(HashAlgorithm::kMd5, algo);
  ASSERT_TRUE(HashAlgorithmFromName("SHA-256", &algo));
  EXPECT_EQ(HashAlgorithm::kSha256, algo);
  ASSERT_TRUE(HashAlgorithmFromName("Sha512", &algo));
  EXPECT_EQ(HashAlgorithm::kSha512, algo);
  EXPECT_FALSE(HashAlgorithmFromName("SHA384", &algo));
  EXPECT_FALSE(HashAlgorithmFromName("", &algo));
}

TEST(HashTest, ParseList)
{
  char error[256];
  uint32_t algos = 0;

  ASSERT_TRUE(HashAlgorithmParseList("MD5,sha256", &algos, error, sizeof error)) << error;
  EXPECT_EQ(HashAlgorithmBit(HashAlgorithm::kMd5) | HashAlgorithmBit(HashAlgorithm::kSha256), algos);
  EXPECT_EQ(2, HashAlgorithmCount(algos));

  EXPECT_FALSE(HashAlgorithmParseList("MD5,RIPEMD160", &algos, error, sizeof error));
  EXPECT_STREQ("unsupported hash algorithm: RIPEMD160", error);

  EXPECT_FALSE(HashAlgorithmParseList("", &algos, error, sizeof error));
  EXPECT_STREQ("no hash algorithms given", error);
}

TEST(HashTest, MissingFileIsIoError)
{
  TestDirectory dir;
  char path[kTestPathSize];
  dir.Join(path, "does-not-exist");

  char error[256];
  DigestResult result;
  EXPECT_EQ(DigestStatus::kIoError, DigestFile(path, kAllHashAlgorithms, &result, error, sizeof error));
  EXPECT_NE(nullptr, strstr(error, "couldn't open"));
}

TEST(HashTest, ReadFailureIsIoError)
{
  TestDirectory dir;

  // A directory opens fine but can't be read.
  char error[256];
  DigestResult result;
  EXPECT_EQ(DigestStatus::kIoError, DigestFile(dir.Path(), kAllHashAlgorithms, &result, error, sizeof error));
}

static bool StopImmediately(void*)
{
  return false;
}

TEST(HashTest, CancelledStream)
{
  TestDirectory dir;
  uint8_t data[219];
  MakeFixture(data);
  dir.WriteFile("fixture.bin", data, sizeof data);

  char path[kTestPathSize];
  dir.Join(path, "fixture.bin");

  char error[256];
  DigestResult result;
  EXPECT_EQ(DigestStatus::kCancelled,
            DigestFile(path, kAllHashAlgorithms, &result, error, sizeof error, StopImmediately, nullptr));
}
