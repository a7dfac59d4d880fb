#ifndef MEMALLOCLINEAR_HPP
#define MEMALLOCLINEAR_HPP

#include "Common.hpp"
#include "Thread.hpp"
#include <cstring>

namespace hs
{

struct MemAllocHeap;

struct MemAllocLinearChunk
{
  MemAllocLinearChunk* m_Prev;
  char*                m_Pointer;   // aligned start of the chunk's storage
  size_t               m_Size;
};

// Bump allocator over a chain of heap chunks. Memory is only released in bulk,
// by LinearAllocDestroy or when a MemAllocLinearScope unwinds.
struct MemAllocLinear
{
  enum
  {
    kMaxAlignment     = 64
  };

  MemAllocLinearChunk* m_Chunk;
  size_t               m_Offset;
  size_t               m_ChunkSize;
  MemAllocHeap*        m_BackingHeap;
  const char*          m_DebugName;
  ThreadId             m_OwnerThread;
};

void LinearAllocInit(MemAllocLinear* allocator, MemAllocHeap* heap, size_t chunk_size, const char* debug_name);

void LinearAllocDestroy(MemAllocLinear* allocator);

void LinearAllocSetOwner(MemAllocLinear* allocator, ThreadId thread_id);

void* LinearAllocate(MemAllocLinear* allocator, size_t size, size_t align);

// Drop every allocation made after (chunk, offset) was observed.
void LinearAllocRewind(MemAllocLinear* allocator, MemAllocLinearChunk* chunk, size_t offset);

class MemAllocLinearScope
{
  MemAllocLinear*      m_Allocator;
  MemAllocLinearChunk* m_Chunk;
  size_t               m_Offset;

public:
  explicit MemAllocLinearScope(MemAllocLinear* a)
  : m_Allocator(a)
  , m_Chunk(a->m_Chunk)
  , m_Offset(a->m_Offset)
  {
  }

  ~MemAllocLinearScope()
  {
    LinearAllocRewind(m_Allocator, m_Chunk, m_Offset);
  }

private:
  MemAllocLinearScope(const MemAllocLinearScope&);
  MemAllocLinearScope& operator=(const MemAllocLinearScope&);
};

template <typename T>
T* LinearAllocate(MemAllocLinear *allocator)
{
  return static_cast<T*>(LinearAllocate(allocator, sizeof(T), ALIGNOF(T)));
}

template <typename T>
T* LinearAllocateArray(MemAllocLinear *allocator, size_t count)
{
  return static_cast<T*>(LinearAllocate(allocator, sizeof(T) * count, ALIGNOF(T)));
}

inline char* StrDupN(MemAllocLinear* allocator, const char* str, size_t len)
{
  char* buffer = static_cast<char*>(LinearAllocate(allocator, len + 1, 1));
  memcpy(buffer, str, len);
  buffer[len] = '\0';
  return buffer;
}

inline char* StrDup(MemAllocLinear* allocator, const char* str)
{
  return StrDupN(allocator, str, strlen(str));
}

}

#endif
