#include "ReferenceData.hpp"
#include "MemAllocHeap.hpp"
#include "TestHarness.hpp"

using namespace hs;

class ReferenceDataTest : public ::testing::Test
{
protected:
  MemAllocHeap heap;
  ReferenceSet set;
  char         error[1024];

  void SetUp() override
  {
    HeapInit(&heap);
    ReferenceSetInit(&set, &heap);
    error[0] = '\0';
  }

  void TearDown() override
  {
    ReferenceSetDestroy(&set);
    HeapDestroy(&heap);
  }

  bool LoadJson(const char* text)
  {
    return ReferenceSetLoadJson(&set, text, strlen(text), error, sizeof error);
  }

  bool LoadCsv(const char* text)
  {
    return ReferenceSetLoadCsv(&set, text, strlen(text), error, sizeof error);
  }

  const char* Digest(size_t record, HashAlgorithm::Enum algorithm) const
  {
    return set.m_Records[record].m_Digests[algorithm];
  }
};

TEST_F(ReferenceDataTest, JsonRecords)
{
  const char* text =
    "[\n"
    "  { \"Filename\": \"a.exe\", \"MD5\": \"abcd\", \"SHA256\": \"\" },\n"
    "  { \"Filename\": \"b.dll\", \"SHA1\": null, \"SHA512\": \"ff\", \"Comment\": 12 }\n"
    "]";

  ASSERT_TRUE(LoadJson(text)) << error;
  ASSERT_EQ(2u, set.m_Records.m_Size);

  EXPECT_STREQ("a.exe", set.m_Records[0].m_Filename);
  EXPECT_STREQ("abcd", Digest(0, HashAlgorithm::kMd5));
  EXPECT_EQ(nullptr, Digest(0, HashAlgorithm::kSha1));
  ASSERT_NE(nullptr, Digest(0, HashAlgorithm::kSha256));
  EXPECT_STREQ("", Digest(0, HashAlgorithm::kSha256));

  EXPECT_STREQ("b.dll", set.m_Records[1].m_Filename);
  EXPECT_EQ(nullptr, Digest(1, HashAlgorithm::kMd5));
  EXPECT_EQ(nullptr, Digest(1, HashAlgorithm::kSha1));
  EXPECT_STREQ("ff", Digest(1, HashAlgorithm::kSha512));
}

TEST_F(ReferenceDataTest, JsonEmptyArray)
{
  ASSERT_TRUE(LoadJson("[]")) << error;
  EXPECT_EQ(0u, set.m_Records.m_Size);
}

TEST_F(ReferenceDataTest, JsonErrors)
{
  EXPECT_FALSE(LoadJson("[{\"Filename\": \"a\""));
  EXPECT_NE(nullptr, strstr(error, "invalid JSON"));

  EXPECT_FALSE(LoadJson("{\"Filename\": \"a\"}"));
  EXPECT_STREQ("expected an array of reference records", error);

  EXPECT_FALSE(LoadJson("[\"a\"]"));
  EXPECT_STREQ("reference record 0 is not an object", error);

  EXPECT_FALSE(LoadJson("[{\"Filename\": \"a\", \"MD5\": 5}]"));
  EXPECT_STREQ("reference record 0: MD5 must be a string", error);

  EXPECT_FALSE(LoadJson("[{\"MD5\": \"aa\"}]"));
  EXPECT_STREQ("reference record 0 has no Filename", error);
}

TEST_F(ReferenceDataTest, CsvRecords)
{
  const char* text =
    "Filename,MD5,SHA1\r\n"
    "a.exe,abcd,\r\n"
    "b.dll,,ef01\r\n";

  ASSERT_TRUE(LoadCsv(text)) << error;
  ASSERT_EQ(2u, set.m_Records.m_Size);

  EXPECT_STREQ("a.exe", set.m_Records[0].m_Filename);
  EXPECT_STREQ("abcd", Digest(0, HashAlgorithm::kMd5));
  EXPECT_STREQ("", Digest(0, HashAlgorithm::kSha1));

  // Columns the header doesn't name are unsupplied, not empty.
  EXPECT_EQ(nullptr, Digest(0, HashAlgorithm::kSha256));
  EXPECT_EQ(nullptr, Digest(0, HashAlgorithm::kSha512));

  EXPECT_STREQ("", Digest(1, HashAlgorithm::kMd5));
  EXPECT_STREQ("ef01", Digest(1, HashAlgorithm::kSha1));
}

TEST_F(ReferenceDataTest, CsvQuotingAndLayout)
{
  const char* text =
    "\xEF\xBB\xBF" "Notes,SHA256,Filename\n"
    "\"has, comma\",aa,\"quoted \"\"name\"\".txt\"\n"
    "\n"
    "\"multi\nline\",bb,plain.txt\n"
    "short";

  ASSERT_TRUE(LoadCsv(text)) << error;
  ASSERT_EQ(3u, set.m_Records.m_Size);

  EXPECT_STREQ("quoted \"name\".txt", set.m_Records[0].m_Filename);
  EXPECT_STREQ("aa", Digest(0, HashAlgorithm::kSha256));

  EXPECT_STREQ("plain.txt", set.m_Records[1].m_Filename);
  EXPECT_STREQ("bb", Digest(1, HashAlgorithm::kSha256));

  // Missing trailing fields stay unsupplied.
  EXPECT_STREQ("", set.m_Records[2].m_Filename);
  EXPECT_EQ(nullptr, Digest(2, HashAlgorithm::kSha256));
}

TEST_F(ReferenceDataTest, CsvErrors)
{
  EXPECT_FALSE(LoadCsv(""));
  EXPECT_STREQ("missing header row", error);

  EXPECT_FALSE(LoadCsv("Name,MD5\na,b\n"));
  EXPECT_STREQ("header has no Filename column", error);

  EXPECT_FALSE(LoadCsv("Filename,MD5\n\"open,aa\n"));
  EXPECT_STREQ("line 2: unterminated quoted field", error);
}

TEST_F(ReferenceDataTest, LoadFileByExtension)
{
  TestDirectory dir;
  dir.WriteFile("refs.json", "[{\"Filename\": \"x\", \"MD5\": \"11\"}]");
  dir.WriteFile("refs.csv", "Filename,MD5\ny,22\n");

  char path[kTestPathSize];
  dir.Join(path, "refs.json");
  ASSERT_TRUE(ReferenceSetLoadFile(&set, path, error, sizeof error)) << error;

  dir.Join(path, "refs.csv");
  ASSERT_TRUE(ReferenceSetLoadFile(&set, path, error, sizeof error)) << error;

  ASSERT_EQ(2u, set.m_Records.m_Size);
  EXPECT_STREQ("x", set.m_Records[0].m_Filename);
  EXPECT_STREQ("y", set.m_Records[1].m_Filename);
  EXPECT_STREQ("22", Digest(1, HashAlgorithm::kMd5));
}

TEST_F(ReferenceDataTest, LoadFileSniffsContent)
{
  TestDirectory dir;
  dir.WriteFile("refs.dat", "  \n[{\"Filename\": \"x\"}]");
  dir.WriteFile("refs.txt", "Filename\ny\n");

  char path[kTestPathSize];
  dir.Join(path, "refs.dat");
  ASSERT_TRUE(ReferenceSetLoadFile(&set, path, error, sizeof error)) << error;

  dir.Join(path, "refs.txt");
  ASSERT_TRUE(ReferenceSetLoadFile(&set, path, error, sizeof error)) << error;

  ASSERT_EQ(2u, set.m_Records.m_Size);
  EXPECT_STREQ("x", set.m_Records[0].m_Filename);
  EXPECT_STREQ("y", set.m_Records[1].m_Filename);
}

TEST_F(ReferenceDataTest, LoadFileErrorsNameThePath)
{
  TestDirectory dir;
  dir.WriteFile("bad.json", "{}");

  char path[kTestPathSize];
  dir.Join(path, "bad.json");
  EXPECT_FALSE(ReferenceSetLoadFile(&set, path, error, sizeof error));
  EXPECT_EQ(0, strncmp(error, path, strlen(path)));
  EXPECT_NE(nullptr, strstr(error, "expected an array"));

  dir.Join(path, "absent.csv");
  EXPECT_FALSE(ReferenceSetLoadFile(&set, path, error, sizeof error));
  EXPECT_EQ(0, strncmp(error, path, strlen(path)));
}
