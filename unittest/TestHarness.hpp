#ifndef TESTHARNESS_HPP
#define TESTHARNESS_HPP

#include <gtest/gtest.h>

#include <stddef.h>
#include <stdio.h>
#include <string.h>
#include <stdint.h>

namespace hs
{

enum
{
  kTestPathSize = 1024
};

// Fresh directory under $TMPDIR, removed with everything in it when the
// object goes away.
class TestDirectory
{
  char m_Path[kTestPathSize];

public:
  TestDirectory();
  ~TestDirectory();

  const char* Path() const { return m_Path; }

  // `relative` joined onto the directory.
  void Join(char (&out)[kTestPathSize], const char* relative) const;

  void MakeDir(const char* relative) const;
  void WriteFile(const char* relative, const void* data, size_t size) const;
  void WriteFile(const char* relative, const char* text) const;

private:
  TestDirectory(const TestDirectory&);
  TestDirectory& operator=(const TestDirectory&);
};

// Reads back everything written to `f` from the start, nul-terminated.
// Returns the number of bytes read.
size_t ReadBack(FILE* f, char* buffer, size_t buffer_size);

}

#endif
