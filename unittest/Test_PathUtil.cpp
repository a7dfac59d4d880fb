#include "PathUtil.hpp"
#include "MemAllocHeap.hpp"
#include "MemAllocLinear.hpp"
#include "TestHarness.hpp"

using namespace hs;

class PathUtilTest : public ::testing::Test
{
protected:
  MemAllocHeap heap;
  MemAllocLinear alloc;

protected:
  void SetUp() override
  {
    HeapInit(&heap);
    LinearAllocInit(&alloc, &heap, KB(16), "path test");
  }

  void TearDown() override
  {
    LinearAllocDestroy(&alloc);
    HeapDestroy(&heap);
  }
};

TEST_F(PathUtilTest, NormalizeRoot)
{
  static const struct
  {
    const char *root;
    bool        is_dir;
    const char *expected;
  }
  test_data[] =
  {
    { "/data/files",                 true,  "/data/files/" },
    { "/data/files/",                true,  "/data/files/" },
    { "/data/files///",              true,  "/data/files/" },
    { "//",                          true,  "/" },
    { "FileSystem::/data/files",     true,  "/data/files/" },
    { "A::B::/data",                 true,  "/data/" },
    { "/data/files/a.txt",           false, "/data/files/a.txt" },
    { "",                            true,  "" },
    { "/",                           true,  "/" },
  };

  for (size_t i = 0; i < ARRAY_SIZE(test_data); ++i)
  {
    const char* result = PathNormalizeRoot(&alloc, test_data[i].root, test_data[i].is_dir);
    EXPECT_STREQ(test_data[i].expected, result) << "root: " << test_data[i].root;
  }
}

TEST_F(PathUtilTest, RelativeIgnoresTrailingSeparator)
{
  const char* with_sep    = PathNormalizeRoot(&alloc, "/srv/R/", true);
  const char* without_sep = PathNormalizeRoot(&alloc, "/srv/R", true);

  EXPECT_STREQ("sub/file.txt", PathRelativeToRoot("/srv/R/sub/file.txt", with_sep));
  EXPECT_STREQ("sub/file.txt", PathRelativeToRoot("/srv/R/sub/file.txt", without_sep));
}

TEST_F(PathUtilTest, RelativeIgnoresRepeatedTrailingSeparators)
{
  const char* doubled = PathNormalizeRoot(&alloc, "/R//", true);
  EXPECT_STREQ("/R/", doubled);

  EXPECT_STREQ("sub/file.txt", PathRelativeToRoot("/R/sub/file.txt", doubled));
  EXPECT_STREQ("sub/file.txt", PathRelativeToRoot("/R//sub/file.txt", doubled));
  EXPECT_STREQ("sub/file.txt", PathRelativeToRoot("/R///sub/file.txt", "/R/"));
}

TEST_F(PathUtilTest, RelativeStripsProvider)
{
  const char* root = PathNormalizeRoot(&alloc, "Microsoft.PowerShell.Core\\FileSystem::/srv/R", true);
  EXPECT_STREQ("/srv/R/", root);
  EXPECT_STREQ("x.bin", PathRelativeToRoot("/srv/R/x.bin", root));
}

TEST_F(PathUtilTest, RelativeIsCaseInsensitive)
{
  EXPECT_STREQ("Sub/File.TXT", PathRelativeToRoot("/SRV/r/Sub/File.TXT", "/srv/R/"));
}

TEST_F(PathUtilTest, RelativeFallsBackToFullPath)
{
  EXPECT_STREQ("/elsewhere/file.txt", PathRelativeToRoot("/elsewhere/file.txt", "/srv/R/"));
  EXPECT_STREQ("/srv/Rx/file.txt", PathRelativeToRoot("/srv/Rx/file.txt", "/srv/R/"));
  EXPECT_STREQ("/srv/file.txt", PathRelativeToRoot("/srv/file.txt", ""));
}

TEST_F(PathUtilTest, BaseName)
{
  EXPECT_STREQ("file.txt", PathBaseName("/a/b/file.txt"));
  EXPECT_STREQ("file.txt", PathBaseName("file.txt"));
  EXPECT_STREQ("", PathBaseName("/a/b/"));

  EXPECT_STREQ("readme.md", PathBaseNameLower(&alloc, "/Docs/README.MD"));
  EXPECT_STREQ("mixed-Ü.bin", PathBaseNameLower(&alloc, "/x/MIXED-Ü.BIN"));
}

TEST_F(PathUtilTest, Parent)
{
  EXPECT_STREQ("/a/b", PathParent(&alloc, "/a/b/file.txt"));
  EXPECT_STREQ("/", PathParent(&alloc, "/file.txt"));
  EXPECT_STREQ("", PathParent(&alloc, "file.txt"));
}

TEST_F(PathUtilTest, Join)
{
  EXPECT_STREQ("/a/b", PathJoin(&alloc, "/a", "b"));
  EXPECT_STREQ("/a/b", PathJoin(&alloc, "/a/", "b"));
  EXPECT_STREQ("b", PathJoin(&alloc, "", "b"));
}
