#include "TestHarness.hpp"

#include <errno.h>
#include <ftw.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hs
{

TestDirectory::TestDirectory()
{
  const char* tmp = getenv("TMPDIR");
  snprintf(m_Path, sizeof m_Path, "%s/hashsig-test-XXXXXX", tmp && tmp[0] ? tmp : "/tmp");

  if (!mkdtemp(m_Path))
  {
    ADD_FAILURE() << "mkdtemp failed: " << strerror(errno);
    m_Path[0] = '\0';
  }
}

static int RemoveEntry(const char* path, const struct stat*, int, struct FTW*)
{
  return remove(path);
}

TestDirectory::~TestDirectory()
{
  if (m_Path[0])
  {
    // Restore permissions that tests may have taken away.
    chmod(m_Path, 0700);
    if (0 != nftw(m_Path, RemoveEntry, 16, FTW_DEPTH | FTW_PHYS))
      fprintf(stderr, "couldn't remove %s: %s\n", m_Path, strerror(errno));
  }
}

void TestDirectory::Join(char (&out)[kTestPathSize], const char* relative) const
{
  snprintf(out, sizeof out, "%s/%s", m_Path, relative);
}

void TestDirectory::MakeDir(const char* relative) const
{
  char path[kTestPathSize];
  Join(path, relative);
  ASSERT_EQ(0, mkdir(path, 0755)) << path << ": " << strerror(errno);
}

void TestDirectory::WriteFile(const char* relative, const void* data, size_t size) const
{
  char path[kTestPathSize];
  Join(path, relative);

  FILE* f = fopen(path, "wb");
  ASSERT_NE(nullptr, f) << path << ": " << strerror(errno);
  if (size)
    ASSERT_EQ(size, fwrite(data, 1, size, f));
  ASSERT_EQ(0, fclose(f));
}

void TestDirectory::WriteFile(const char* relative, const char* text) const
{
  WriteFile(relative, text, strlen(text));
}

size_t ReadBack(FILE* f, char* buffer, size_t buffer_size)
{
  rewind(f);
  size_t n = fread(buffer, 1, buffer_size - 1, f);
  buffer[n] = '\0';
  return n;
}

}
