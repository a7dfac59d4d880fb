#include "Driver.hpp"
#include "TestHarness.hpp"

using namespace hs;

class DriverTest : public ::testing::Test
{
protected:
  TestDirectory dir;
  DriverOptions options;
  char          output_path[kTestPathSize];
  char          text[16384];

  void SetUp() override
  {
    DriverOptionsInit(&options);
    options.m_ThreadCount = 2;

    dir.MakeDir("data");
    dir.WriteFile("data/abc.txt", "abc");
    dir.Join(output_path, "out.csv");
    options.m_OutputFile = output_path;
  }

  RunResult::Enum RunAndExport(bool* exported)
  {
    char data[kTestPathSize];
    dir.Join(data, "data");
    const char* paths[] = { data };

    Driver driver;
    EXPECT_TRUE(DriverInit(&driver, &options));

    RunResult::Enum result = DriverRun(&driver, paths, 1);
    *exported = DriverExport(&driver);
    DriverDestroy(&driver);

    text[0] = '\0';
    if (FILE* f = fopen(output_path, "rb"))
    {
      ReadBack(f, text, sizeof text);
      fclose(f);
    }
    return result;
  }
};

TEST_F(DriverTest, RejectsBadConfiguration)
{
  Driver driver;

  DriverOptions bad = options;
  bad.m_Format = "xml";
  EXPECT_FALSE(DriverInit(&driver, &bad));

  bad = options;
  bad.m_Algorithms = "md5,crc32";
  EXPECT_FALSE(DriverInit(&driver, &bad));

  bad = options;
  bad.m_ReferenceFile = "refs.csv";
  bad.m_RepositoryUri = "";
  EXPECT_FALSE(DriverInit(&driver, &bad));

  bad = options;
  bad.m_MaxRequests = 0;
  EXPECT_FALSE(DriverInit(&driver, &bad));
}

TEST_F(DriverTest, PicksModeFromOptions)
{
  Driver driver;

  ASSERT_TRUE(DriverInit(&driver, &options));
  EXPECT_EQ(DriverMode::kHash, driver.m_Mode);
  EXPECT_EQ(uint32_t(kAllHashAlgorithms), driver.m_HashAlgorithms);
  DriverDestroy(&driver);

  DriverOptions opts = options;
  opts.m_RepositoryUri = "";
  opts.m_Algorithms    = "sha256";
  ASSERT_TRUE(DriverInit(&driver, &opts));
  EXPECT_EQ(DriverMode::kRepository, driver.m_Mode);
  EXPECT_EQ(uint32_t(kAllHashAlgorithms), driver.m_HashAlgorithms);
  EXPECT_EQ(HashAlgorithmBit(HashAlgorithm::kSha256), driver.m_LookupAlgorithms);
  DriverDestroy(&driver);

  opts = options;
  opts.m_Algorithms = "md5, sha1";
  ASSERT_TRUE(DriverInit(&driver, &opts));
  EXPECT_EQ(HashAlgorithmBit(HashAlgorithm::kMd5) | HashAlgorithmBit(HashAlgorithm::kSha1), driver.m_HashAlgorithms);
  DriverDestroy(&driver);

  opts = options;
  opts.m_ReferenceTemplate = true;
  ASSERT_TRUE(DriverInit(&driver, &opts));
  EXPECT_EQ(DriverMode::kReferenceTemplate, driver.m_Mode);
  DriverDestroy(&driver);
}

TEST_F(DriverTest, HashModeWritesCsv)
{
  options.m_Algorithms = "md5";

  bool exported = false;
  EXPECT_EQ(RunResult::kOk, RunAndExport(&exported));
  EXPECT_TRUE(exported);

  static const char header[] =
    "Filename,PathRelativeToRoot,RootPath,SizeBytes,CreatedUtc,ModifiedUtc,MD5,EntryTimestamp\r\n";
  EXPECT_EQ(0, strncmp(text, header, sizeof header - 1));
  EXPECT_NE(nullptr, strstr(text, "\r\nabc.txt,abc.txt,"));
  EXPECT_NE(nullptr, strstr(text, ",3,"));
  EXPECT_NE(nullptr, strstr(text, ",900150983CD24FB0D6963F7D28E17F72,"));
  EXPECT_EQ(nullptr, strstr(text, "SHA1"));
}

TEST_F(DriverTest, VerifyModeAgainstReferenceFile)
{
  dir.WriteFile("refs.json",
    "[{\"Filename\":\"abc.txt\",\"MD5\":\"900150983cd24fb0d6963f7d28e17f72\",\"SHA1\":\"00\"}]");

  char refs[kTestPathSize];
  dir.Join(refs, "refs.json");
  options.m_ReferenceFile = refs;
  options.m_Format        = "json";
  options.m_Placeholder   = "none";

  bool exported = false;
  EXPECT_EQ(RunResult::kOk, RunAndExport(&exported));
  EXPECT_TRUE(exported);

  EXPECT_NE(nullptr, strstr(text, "\"MD5HashMatch\":true"));
  EXPECT_NE(nullptr, strstr(text, "\"SHA1HashMatch\":false"));
  EXPECT_NE(nullptr, strstr(text, "\"SHA256HashMatch\":\"none\""));
  EXPECT_NE(nullptr, strstr(text, "\"SHA512HashMatch\":\"none\""));
}

TEST_F(DriverTest, MissingReferenceFileIsSetupError)
{
  char refs[kTestPathSize];
  dir.Join(refs, "absent.csv");
  options.m_ReferenceFile = refs;

  bool exported = false;
  EXPECT_EQ(RunResult::kSetupError, RunAndExport(&exported));
}

TEST_F(DriverTest, ReferenceTemplateIgnoresPaths)
{
  options.m_ReferenceTemplate = true;

  bool exported = false;
  EXPECT_EQ(RunResult::kOk, RunAndExport(&exported));
  EXPECT_TRUE(exported);
  EXPECT_STREQ("Filename,MD5,SHA1,SHA256,SHA512\r\n,,,,\r\n", text);
}

TEST_F(DriverTest, UnwritableOutputFails)
{
  dir.Join(output_path, "missing-dir/out.csv");

  bool exported = true;
  EXPECT_EQ(RunResult::kOk, RunAndExport(&exported));
  EXPECT_FALSE(exported);
}
