#include "MemAllocLinear.hpp"
#include "MemAllocHeap.hpp"
#include "TestHarness.hpp"

#include <stdio.h>

using namespace hs;

class MemAllocLinearTest : public ::testing::Test
{
protected:
  MemAllocHeap heap;
  MemAllocLinear alloc;

protected:
  void SetUp() override
  {
    HeapInit(&heap);
    LinearAllocInit(&alloc, &heap, 512, "test strings");
  }

  void TearDown() override
  {
    LinearAllocDestroy(&alloc);
    EXPECT_EQ(0u, heap.m_LiveAllocations);
    HeapDestroy(&heap);
  }
};

TEST_F(MemAllocLinearTest, MixedAlignments)
{
  char* name = StrDup(&alloc, "a.txt");
  EXPECT_EQ(6u, alloc.m_Offset);

  uint64_t* size = LinearAllocate<uint64_t>(&alloc);
  EXPECT_EQ(0u, uintptr_t(size) % ALIGNOF(uint64_t));
  EXPECT_EQ(16u, alloc.m_Offset);

  void* block = LinearAllocate(&alloc, 3, 64);
  EXPECT_EQ(0u, uintptr_t(block) % 64);

  EXPECT_STREQ("a.txt", name);
}

TEST_F(MemAllocLinearTest, StrDupNStopsAtLength)
{
  const char* path = "/data/files/setup.exe";
  char* dir = StrDupN(&alloc, path, 11);
  EXPECT_STREQ("/data/files", dir);

  char* empty = StrDupN(&alloc, path, 0);
  EXPECT_STREQ("", empty);
}

TEST_F(MemAllocLinearTest, ScopeRewindsOffset)
{
  StrDup(&alloc, "kept");
  size_t mark = alloc.m_Offset;
  {
    MemAllocLinearScope scope(&alloc);
    LinearAllocateArray<uint32_t>(&alloc, 20);
    EXPECT_LT(mark, alloc.m_Offset);
  }
  EXPECT_EQ(mark, alloc.m_Offset);
}

TEST_F(MemAllocLinearTest, OversizedRequestGetsOwnChunk)
{
  MemAllocLinearChunk* first = alloc.m_Chunk;
  char* kept = StrDup(&alloc, "kept");

  {
    MemAllocLinearScope scope(&alloc);
    char* big = static_cast<char*>(LinearAllocate(&alloc, 4096, 16));
    ASSERT_NE(first, alloc.m_Chunk);
    memset(big, 0xcd, 4096);
    EXPECT_EQ(2u, heap.m_LiveAllocations);
  }

  EXPECT_EQ(first, alloc.m_Chunk);
  EXPECT_EQ(1u, heap.m_LiveAllocations);
  EXPECT_STREQ("kept", kept);
}

TEST_F(MemAllocLinearTest, ManySmallStringsSpanChunks)
{
  char* names[200];
  for (int i = 0; i < 200; ++i)
  {
    char tmp[32];
    snprintf(tmp, sizeof tmp, "file-%03d.bin", i);
    names[i] = StrDup(&alloc, tmp);
  }

  EXPECT_LT(1u, heap.m_LiveAllocations);

  for (int i = 0; i < 200; ++i)
  {
    char tmp[32];
    snprintf(tmp, sizeof tmp, "file-%03d.bin", i);
    EXPECT_STREQ(tmp, names[i]);
  }
}
